/*
 * grid.cpp
 *
 *  Created on: Oct 2, 2026
 *      Author: rob
 */

#include <cmath>
#include <sstream>
#include <iomanip>

#include <ogr_spatialref.h>

#include "grid.hpp"

using namespace sarflood::grid;

GridProps::GridProps() :
	m_cols(0), m_rows(0),
	m_nodata(0),
	m_nodataSet(false) {
	setTrans(0, 0, 1, -1);
}

void GridProps::setSize(int cols, int rows) {
	if(cols < 0 || rows < 0)
		sf_argerr("Grid size must not be negative: " << cols << ", " << rows);
	m_cols = cols;
	m_rows = rows;
}

int GridProps::cols() const {
	return m_cols;
}

int GridProps::rows() const {
	return m_rows;
}

size_t GridProps::size() const {
	return (size_t) m_cols * m_rows;
}

void GridProps::setTrans(const double* trans) {
	for(int i = 0; i < 6; ++i)
		m_trans[i] = trans[i];
}

void GridProps::trans(double* trans) const {
	for(int i = 0; i < 6; ++i)
		trans[i] = m_trans[i];
}

void GridProps::setTrans(double tlx, double tly, double resX, double resY) {
	m_trans[0] = tlx;
	m_trans[1] = resX;
	m_trans[2] = 0;
	m_trans[3] = tly;
	m_trans[4] = 0;
	m_trans[5] = resY;
}

double GridProps::resX() const {
	return m_trans[1];
}

double GridProps::resY() const {
	return m_trans[5];
}

double GridProps::cellArea() const {
	// Determinant of the linear part handles rotated grids too.
	return std::abs(m_trans[1] * m_trans[5] - m_trans[2] * m_trans[4]);
}

double GridProps::toX(double col, double row) const {
	return m_trans[0] + col * m_trans[1] + row * m_trans[2];
}

double GridProps::toY(double row, double col) const {
	return m_trans[3] + col * m_trans[4] + row * m_trans[5];
}

bool GridProps::hasCell(int col, int row) const {
	return col >= 0 && row >= 0 && col < m_cols && row < m_rows;
}

void GridProps::setProjection(const std::string& wkt) {
	m_projection = wkt;
}

const std::string& GridProps::projection() const {
	return m_projection;
}

void GridProps::setNoData(double nodata) {
	m_nodata = nodata;
	m_nodataSet = true;
}

double GridProps::nodata() const {
	return m_nodata;
}

bool GridProps::nodataSet() const {
	return m_nodataSet;
}

bool GridProps::sameGrid(const GridProps& other, std::string* reason) const {
	std::stringstream ss;
	if(m_cols != other.m_cols || m_rows != other.m_rows) {
		ss << "size differs (" << m_cols << "x" << m_rows << " vs " << other.m_cols << "x" << other.m_rows << ")";
	} else {
		for(int i = 0; i < 6; ++i) {
			// Tolerate representation noise only; co-registered grids are identical.
			double tol = 1e-9 * sarflood::max(1.0, sarflood::max(std::abs(m_trans[i]), std::abs(other.m_trans[i])));
			if(std::abs(m_trans[i] - other.m_trans[i]) > tol) {
				ss << std::setprecision(12) << "transform coefficient " << i << " differs (" << m_trans[i] << " vs " << other.m_trans[i] << ")";
				break;
			}
		}
	}
	if(ss.str().empty() && m_projection != other.m_projection) {
		if(m_projection.empty() || other.m_projection.empty()) {
			ss << "CRS differs (one grid has no CRS)";
		} else {
			OGRSpatialReference a;
			OGRSpatialReference b;
			if(OGRERR_NONE != a.importFromWkt(m_projection.c_str())
					|| OGRERR_NONE != b.importFromWkt(other.m_projection.c_str())) {
				ss << "CRS could not be parsed";
			} else if(!a.IsSame(&b)) {
				ss << "CRS differs";
			}
		}
	}
	if(reason)
		*reason = ss.str();
	return ss.str().empty();
}

DatasetPtr sarflood::grid::openRaster(const std::string& filename) {
	DatasetPtr ds((GDALDataset*) GDALOpenEx(filename.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
	if(!ds)
		sf_runerr("Failed to open raster " << filename << ".");
	return ds;
}
