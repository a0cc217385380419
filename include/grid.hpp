/*
 * grid.hpp
 *
 * In-memory raster bands with GDAL-backed reading and writing, and the
 * flood fill machinery used to find connected regions.
 *
 *  Created on: Oct 2, 2026
 *      Author: rob
 */

#ifndef INCLUDE_GRID_HPP_
#define INCLUDE_GRID_HPP_

#include <vector>
#include <string>
#include <memory>
#include <queue>
#include <algorithm>
#include <cmath>
#include <cstdint>

#include <gdal_priv.h>

#include "sarflood.hpp"

namespace sarflood {

	namespace grid {

		/**
		 * \brief Closes a GDAL dataset when its handle goes out of scope.
		 */
		class DatasetCloser {
		public:
			void operator()(GDALDataset* ds) const {
				if(ds)
					GDALClose(ds);
			}
		};

		typedef std::unique_ptr<GDALDataset, DatasetCloser> DatasetPtr;

		/**
		 * \brief Return the GDAL data type corresponding to a C++ type.
		 */
		template <class T> GDALDataType gdalType();
		template <> inline GDALDataType gdalType<uint8_t>() { return GDT_Byte; }
		template <> inline GDALDataType gdalType<int16_t>() { return GDT_Int16; }
		template <> inline GDALDataType gdalType<int32_t>() { return GDT_Int32; }
		template <> inline GDALDataType gdalType<float>() { return GDT_Float32; }
		template <> inline GDALDataType gdalType<double>() { return GDT_Float64; }

		/**
		 * \brief The shape, georeferencing and nodata value of a raster.
		 */
		class GridProps {
		private:
			int m_cols;					///<! The number of columns.
			int m_rows;					///<! The number of rows.
			double m_trans[6];			///<! The GDAL geotransform.
			std::string m_projection;	///<! The CRS as WKT.
			double m_nodata;			///<! The nodata value.
			bool m_nodataSet;			///<! True if the nodata value is set.

		public:

			GridProps();

			/**
			 * \brief Set the number of columns and rows.
			 *
			 * \param cols The number of columns.
			 * \param rows The number of rows.
			 */
			void setSize(int cols, int rows);

			int cols() const;

			int rows() const;

			/**
			 * \brief Return the number of cells.
			 *
			 * \return The number of cells.
			 */
			size_t size() const;

			/**
			 * \brief Set the six-element GDAL geotransform.
			 *
			 * \param trans The geotransform.
			 */
			void setTrans(const double* trans);

			/**
			 * \brief Copy the geotransform into the given six-element array.
			 *
			 * \param trans The output array.
			 */
			void trans(double* trans) const;

			/**
			 * \brief Convenience: set a north-up transform from the top-left corner and resolution.
			 *
			 * \param tlx The top-left x coordinate.
			 * \param tly The top-left y coordinate.
			 * \param resX The x resolution.
			 * \param resY The y resolution (negative for north-up).
			 */
			void setTrans(double tlx, double tly, double resX, double resY);

			double resX() const;

			double resY() const;

			/**
			 * \brief Return the area of one cell in squared map units.
			 *
			 * \return The area of one cell.
			 */
			double cellArea() const;

			/**
			 * \brief Return the map x coordinate of the given (fractional) pixel position.
			 */
			double toX(double col, double row = 0) const;

			/**
			 * \brief Return the map y coordinate of the given (fractional) pixel position.
			 */
			double toY(double row, double col = 0) const;

			/**
			 * \brief Return true if the cell is inside the grid.
			 *
			 * \param col The column.
			 * \param row The row.
			 * \return True if the cell is inside the grid.
			 */
			bool hasCell(int col, int row) const;

			void setProjection(const std::string& wkt);

			const std::string& projection() const;

			void setNoData(double nodata);

			double nodata() const;

			bool nodataSet() const;

			/**
			 * \brief Compare the grid of this object to another's.
			 *
			 * Size, geotransform and CRS must match. The nodata value is not considered.
			 *
			 * \param other Another GridProps.
			 * \param[out] reason If not null and the grids differ, receives a description.
			 * \return True if the grids match.
			 */
			bool sameGrid(const GridProps& other, std::string* reason = nullptr) const;

		};

		/**
		 * \brief Determines which cells a flood fill visits and what it writes to them.
		 */
		template <class T, class U>
		class FillOperator {
		public:

			virtual const GridProps& srcProps() const = 0;

			virtual const GridProps& dstProps() const = 0;

			/**
			 * \brief Return true if the cell should be filled.
			 *
			 * Must return false for a cell once it has been filled.
			 */
			virtual bool shouldFill(int col, int row) const = 0;

			/**
			 * \brief Fill the cell.
			 */
			virtual void fill(int col, int row) const = 0;

			virtual ~FillOperator() {}
		};

		template <class T> class Band;

		/**
		 * \brief Fills cells whose source value equals the target and whose
		 * destination value is not yet the fill value.
		 */
		template <class T, class U>
		class TargetFillOperator : public FillOperator<T, U> {
		private:
			Band<T>* m_src;		///<! The source band.
			Band<U>* m_dst;		///<! The destination band.
			T m_target;			///<! The source value to look for.
			U m_fill;			///<! The value written to the destination.

		public:

			/**
			 * \brief Construct the operator.
			 *
			 * \param src The source band.
			 * \param dst The destination band. May be the same as the source if target and fill differ.
			 * \param target The target value in the source.
			 * \param fill The fill value written to the destination.
			 */
			TargetFillOperator(Band<T>* src, Band<U>* dst, T target, U fill) :
				m_src(src), m_dst(dst), m_target(target), m_fill(fill) {
				if((void*) src == (void*) dst && (double) target == (double) fill)
					sf_argerr("The target and fill values must differ when filling in place.");
			}

			const GridProps& srcProps() const {
				return m_src->props();
			}

			const GridProps& dstProps() const {
				return m_dst->props();
			}

			bool shouldFill(int col, int row) const {
				return m_src->props().hasCell(col, row)
						&& m_src->get(col, row) == m_target
						&& m_dst->get(col, row) != m_fill;
			}

			void fill(int col, int row) const {
				m_dst->set(col, row, m_fill);
			}

		};

		/**
		 * \brief A single raster band held in memory.
		 */
		template <class T>
		class Band {
		private:
			GridProps m_props;			///<! The grid properties.
			std::vector<T> m_data;		///<! Row-major cell values.

		public:

			Band() {}

			/**
			 * \brief Construct a band with the given properties, filled with zeros.
			 *
			 * \param props The grid properties.
			 */
			Band(const GridProps& props) {
				init(props);
			}

			/**
			 * \brief Reset the band to the given properties, filled with zeros.
			 *
			 * \param props The grid properties.
			 */
			void init(const GridProps& props) {
				m_props = props;
				m_data.assign(props.size(), (T) 0);
			}

			const GridProps& props() const {
				return m_props;
			}

			GridProps& props() {
				return m_props;
			}

			T get(int col, int row) const {
				return m_data[(size_t) row * m_props.cols() + col];
			}

			void set(int col, int row, T value) {
				m_data[(size_t) row * m_props.cols() + col] = value;
			}

			T get(size_t idx) const {
				return m_data[idx];
			}

			void set(size_t idx, T value) {
				m_data[idx] = value;
			}

			void fill(T value) {
				std::fill(m_data.begin(), m_data.end(), value);
			}

			/**
			 * \brief Return true if the value is the nodata value, NaN or infinite.
			 *
			 * \param value A cell value.
			 * \return True if the value is nodata.
			 */
			bool isNoData(T value) const {
				if(!std::isfinite((double) value))
					return true;
				return m_props.nodataSet() && (double) value == m_props.nodata();
			}

			/**
			 * \brief Count the cells holding the given value.
			 *
			 * \param value A value.
			 * \return The number of cells holding the value.
			 */
			size_t count(T value) const {
				size_t n = 0;
				for(const T& v : m_data) {
					if(v == value)
						++n;
				}
				return n;
			}

			const std::vector<T>& data() const {
				return m_data;
			}

			bool operator==(const Band<T>& other) const {
				return m_props.cols() == other.m_props.cols()
						&& m_props.rows() == other.m_props.rows()
						&& m_data == other.m_data;
			}

			bool operator!=(const Band<T>& other) const {
				return !(*this == other);
			}

			/**
			 * \brief Read one band of a GDAL dataset into this object.
			 *
			 * The grid properties are taken from the dataset; the nodata value from the band.
			 *
			 * \param ds An open dataset.
			 * \param band The 1-based band index.
			 */
			void read(GDALDataset* ds, int band) {
				if(band < 1 || band > ds->GetRasterCount())
					sf_runerr("Band " << band << " is out of range (1-" << ds->GetRasterCount() << ").");
				GridProps props;
				props.setSize(ds->GetRasterXSize(), ds->GetRasterYSize());
				double trans[6];
				if(CE_None != ds->GetGeoTransform(trans))
					sf_warn("Dataset has no geotransform; using the identity.");
				props.setTrans(trans);
				const char* wkt = ds->GetProjectionRef();
				props.setProjection(wkt ? wkt : "");
				GDALRasterBand* b = ds->GetRasterBand(band);
				int hasNoData = 0;
				double nodata = b->GetNoDataValue(&hasNoData);
				if(hasNoData)
					props.setNoData(nodata);
				init(props);
				if(CE_None != b->RasterIO(GF_Read, 0, 0, props.cols(), props.rows(),
						m_data.data(), props.cols(), props.rows(), gdalType<T>(), 0, 0))
					sf_runerr("Failed to read band " << band << ".");
			}

			/**
			 * \brief Create a single-band in-memory GDAL dataset holding a copy of this band.
			 *
			 * \return A dataset handle.
			 */
			DatasetPtr toDataset() const {
				GDALDriver* drv = GetGDALDriverManager()->GetDriverByName("MEM");
				if(!drv)
					sf_runerr("The MEM raster driver is not available.");
				DatasetPtr ds(drv->Create("", m_props.cols(), m_props.rows(), 1, gdalType<T>(), nullptr));
				if(!ds)
					sf_runerr("Failed to create in-memory raster.");
				copyTo(ds.get());
				return ds;
			}

			/**
			 * \brief Write this band to a new single-band raster file.
			 *
			 * \param filename The output file.
			 * \param driver The GDAL driver name.
			 */
			void write(const std::string& filename, const std::string& driver = "GTiff") const {
				GDALDriver* drv = GetGDALDriverManager()->GetDriverByName(driver.c_str());
				if(!drv)
					sf_runerr("Raster driver " << driver << " is not available.");
				char** opts = nullptr;
				if(driver == "GTiff")
					opts = CSLSetNameValue(opts, "COMPRESS", "DEFLATE");
				DatasetPtr ds(drv->Create(filename.c_str(), m_props.cols(), m_props.rows(), 1, gdalType<T>(), opts));
				CSLDestroy(opts);
				if(!ds)
					sf_runerr("Failed to create raster " << filename << ".");
				copyTo(ds.get());
			}

		private:

			void copyTo(GDALDataset* ds) const {
				double trans[6];
				m_props.trans(trans);
				ds->SetGeoTransform(trans);
				if(!m_props.projection().empty())
					ds->SetProjection(m_props.projection().c_str());
				GDALRasterBand* b = ds->GetRasterBand(1);
				if(m_props.nodataSet())
					b->SetNoDataValue(m_props.nodata());
				if(CE_None != b->RasterIO(GF_Write, 0, 0, m_props.cols(), m_props.rows(),
						const_cast<T*>(m_data.data()), m_props.cols(), m_props.rows(), gdalType<T>(), 0, 0))
					sf_runerr("Failed to write raster data.");
			}

		public:

			/**
			 * \brief Fill the region connected to the given cell using the operator.
			 *
			 * This is a scanline fill; each visited row span is filled at once and the rows
			 * above and below are queued.
			 *
			 * \param col The start column.
			 * \param row The start row.
			 * \param op The fill operator.
			 * \param d8 If true, use 8-connectivity; otherwise 4.
			 * \param outminc The minimum column filled (optional).
			 * \param outminr The minimum row filled (optional).
			 * \param outmaxc The maximum column filled (optional).
			 * \param outmaxr The maximum row filled (optional).
			 * \param outarea The number of cells filled (optional).
			 */
			template <class U>
			static void floodFill(int col, int row, FillOperator<T, U>& op, bool d8 = false,
					int* outminc = nullptr, int* outminr = nullptr,
					int* outmaxc = nullptr, int* outmaxr = nullptr,
					int* outarea = nullptr) {

				const GridProps& props = op.srcProps();
				int cols = props.cols();
				int rows = props.rows();

				int minc = cols + 1;
				int minr = rows + 1;
				int maxc = -1;
				int maxr = -1;
				int area = 0;

				std::queue<std::pair<int, int>> q;
				q.emplace(col, row);

				while(!q.empty()) {
					int c = q.front().first;
					int r = q.front().second;
					q.pop();

					if(!op.shouldFill(c, r))
						continue;

					// Extend the span left and right.
					int c0 = c;
					int c1 = c;
					while(c0 > 0 && op.shouldFill(c0 - 1, r))
						--c0;
					while(c1 < cols - 1 && op.shouldFill(c1 + 1, r))
						++c1;

					for(int cc = c0; cc <= c1; ++cc) {
						op.fill(cc, r);
						++area;
					}

					if(c0 < minc) minc = c0;
					if(c1 > maxc) maxc = c1;
					if(r < minr) minr = r;
					if(r > maxr) maxr = r;

					// Queue the neighbouring rows; diagonals too for 8-connectivity.
					int s0 = d8 ? sarflood::max(0, c0 - 1) : c0;
					int s1 = d8 ? sarflood::min(cols - 1, c1 + 1) : c1;
					for(int cc = s0; cc <= s1; ++cc) {
						if(r > 0 && op.shouldFill(cc, r - 1))
							q.emplace(cc, r - 1);
						if(r < rows - 1 && op.shouldFill(cc, r + 1))
							q.emplace(cc, r + 1);
					}
				}

				if(outminc) *outminc = minc;
				if(outminr) *outminr = minr;
				if(outmaxc) *outmaxc = maxc;
				if(outmaxr) *outmaxr = maxr;
				if(outarea) *outarea = area;
			}

		};

		/**
		 * \brief Open a raster for reading.
		 *
		 * \param filename The raster file.
		 * \return A dataset handle.
		 */
		DatasetPtr openRaster(const std::string& filename);

	} // grid

} // sarflood

#endif /* INCLUDE_GRID_HPP_ */
