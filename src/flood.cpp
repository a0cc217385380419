/*
 * flood.cpp
 *
 *  Created on: Oct 2, 2026
 *      Author: rob
 */

#include <cmath>

#include <gdal_alg.h>
#include <ogrsf_frmts.h>
#include <cpl_string.h>

#include "grid.hpp"
#include "flood.hpp"

using namespace sarflood::flood;
using namespace sarflood::flood::util;
using namespace sarflood::grid;

namespace {

	/**
	 * \brief Return a copy of the grid properties without the nodata value.
	 */
	GridProps plainProps(const GridProps& props) {
		GridProps out;
		out.setSize(props.cols(), props.rows());
		double trans[6];
		props.trans(trans);
		out.setTrans(trans);
		out.setProjection(props.projection());
		return out;
	}

	/**
	 * \brief Return true if an 8-neighbour of the cell holds the value.
	 */
	bool touches(const Band<uint8_t>& mask, int col, int row, uint8_t value) {
		const GridProps& props = mask.props();
		for(int r = row - 1; r <= row + 1; ++r) {
			for(int c = col - 1; c <= col + 1; ++c) {
				if((c != col || r != row) && props.hasCell(c, r) && mask.get(c, r) == value)
					return true;
			}
		}
		return false;
	}

	/**
	 * \brief Set the cells with the given label, within the bounds, to the value.
	 */
	void relabel(Band<uint8_t>& mask, const Band<int>& labels, int id,
			int minc, int minr, int maxc, int maxr, uint8_t value) {
		for(int r = minr; r <= maxr; ++r) {
			for(int c = minc; c <= maxc; ++c) {
				if(labels.get(c, r) == id)
					mask.set(c, r, value);
			}
		}
	}

} // anon


Scene::Scene() {
}

Scene::Scene(const std::string& name, const std::vector<Band<float>>& bands) :
	m_name(name),
	m_bands(bands) {
	if(m_bands.empty())
		sf_runerr("Scene " << name << " has no bands.");
	m_props = m_bands.front().props();
	for(size_t i = 1; i < m_bands.size(); ++i) {
		std::string reason;
		if(!m_props.sameGrid(m_bands[i].props(), &reason))
			sf_err(GridMismatchError, "Band " << (i + 1) << " of scene " << name << " does not match band 1: " << reason);
	}
}

Scene Scene::load(const std::string& filename) {
	sf_debug("Loading scene " << filename);
	DatasetPtr ds = openRaster(filename);
	int count = ds->GetRasterCount();
	if(count < 1)
		sf_runerr("Raster " << filename << " has no bands.");
	std::vector<Band<float>> bands(count);
	for(int i = 0; i < count; ++i)
		bands[i].read(ds.get(), i + 1);
	return Scene(filename, bands);
}

const std::string& Scene::name() const {
	return m_name;
}

const GridProps& Scene::props() const {
	return m_props;
}

int Scene::bandCount() const {
	return (int) m_bands.size();
}

const Band<float>& Scene::band(int band) const {
	if(band < 1 || band > bandCount())
		sf_err(ConfigurationError, "Band " << band << " is out of range for scene " << m_name
				<< " (1-" << bandCount() << ").");
	return m_bands[band - 1];
}


BandStats::BandStats() :
	count(0),
	min(std::nan("")), max(std::nan("")), mean(std::nan("")) {
}

BandStats sarflood::flood::computeStats(const Band<float>& band) {
	BandStats stats;
	double sum = 0;
	double mn = sarflood::maxvalue<double>();
	double mx = sarflood::minvalue<double>();
	const std::vector<float>& data = band.data();
	for(float v : data) {
		if(band.isNoData(v))
			continue;
		if(v < mn) mn = v;
		if(v > mx) mx = v;
		sum += v;
		++stats.count;
	}
	if(stats.count) {
		stats.min = mn;
		stats.max = mx;
		stats.mean = sum / stats.count;
	}
	return stats;
}


FloodPolygon::FloodPolygon(int id, std::unique_ptr<OGRGeometry> geom, bool repaired) :
	m_id(id),
	m_geom(std::move(geom)),
	m_area(0),
	m_repaired(repaired) {
	if(!m_geom)
		sf_err(InvalidGeometryError, "Flood polygon " << id << " has no geometry.");
	m_area = geometryArea(*m_geom);
}

int FloodPolygon::id() const {
	return m_id;
}

const OGRGeometry& FloodPolygon::geometry() const {
	return *m_geom;
}

double FloodPolygon::area() const {
	return m_area;
}

bool FloodPolygon::repaired() const {
	return m_repaired;
}


void sarflood::flood::checkGrids(const Scene& ref, const Scene& flood) {
	if(ref.bandCount() != flood.bandCount())
		sf_err(GridMismatchError, "Reference scene " << ref.name() << " has " << ref.bandCount()
				<< " bands but flood scene " << flood.name() << " has " << flood.bandCount() << ".");
	std::string reason;
	if(!ref.props().sameGrid(flood.props(), &reason))
		sf_err(GridMismatchError, "Reference scene " << ref.name() << " and flood scene "
				<< flood.name() << " do not share a grid: " << reason << ".");
}

Band<float> sarflood::flood::computeChange(const Scene& ref, const Scene& flood, BandPolicy policy,
		int band, const std::vector<double>& weights) {

	checkGrids(ref, flood);

	// Collect the bands taking part and their weights.
	std::vector<int> bands;
	std::vector<double> w;
	switch(policy) {
	case BandPolicy::Single:
		if(band < 1 || band > ref.bandCount())
			sf_err(ConfigurationError, "Band " << band << " is out of range for scene " << ref.name()
					<< " (1-" << ref.bandCount() << ").");
		bands.push_back(band);
		w.push_back(1.0);
		break;
	case BandPolicy::Sum:
		for(int b = 1; b <= ref.bandCount(); ++b) {
			bands.push_back(b);
			w.push_back(1.0);
		}
		break;
	case BandPolicy::Weighted:
		if((int) weights.size() != ref.bandCount())
			sf_err(ConfigurationError, "The weighted band policy needs one weight per band; got "
					<< weights.size() << " weights for " << ref.bandCount() << " bands in scene " << ref.name() << ".");
		for(int b = 1; b <= ref.bandCount(); ++b) {
			bands.push_back(b);
			w.push_back(weights[b - 1]);
		}
		break;
	}

	GridProps props = plainProps(ref.props());
	props.setNoData(CHANGE_NODATA);
	Band<float> change(props);

	size_t size = props.size();
	for(size_t i = 0; i < size; ++i) {
		double sum = 0;
		bool valid = true;
		for(size_t j = 0; j < bands.size(); ++j) {
			const Band<float>& rb = ref.band(bands[j]);
			const Band<float>& fb = flood.band(bands[j]);
			float r = rb.get(i);
			float f = fb.get(i);
			if(rb.isNoData(r) || fb.isNoData(f)) {
				valid = false;
				break;
			}
			sum += w[j] * ((double) r - f);
		}
		change.set(i, valid ? (float) sum : CHANGE_NODATA);
	}

	return change;
}

double sarflood::flood::otsuThreshold(const Band<float>& change, int bins) {
	if(bins < 2)
		sf_argerr("At least two histogram bins are required.");

	BandStats stats = computeStats(change);
	if(!stats.count)
		sf_err(EmptyInputError, "The change raster has no valid pixels to threshold.");
	if(stats.max <= stats.min)
		return stats.min;

	double width = (stats.max - stats.min) / bins;
	std::vector<double> hist(bins, 0);
	for(float v : change.data()) {
		if(change.isNoData(v))
			continue;
		int idx = (int) ((v - stats.min) / width);
		hist[sarflood::min(sarflood::max(idx, 0), bins - 1)] += 1;
	}

	double total = (double) stats.count;
	double sumAll = 0;
	for(int i = 0; i < bins; ++i)
		sumAll += i * hist[i];

	double sumB = 0;
	double wB = 0;
	double best = -1;
	int bestK = 0;
	for(int k = 0; k < bins - 1; ++k) {
		wB += hist[k];
		sumB += k * hist[k];
		if(wB == 0)
			continue;
		double wF = total - wB;
		if(wF == 0)
			break;
		double mB = sumB / wB;
		double mF = (sumAll - sumB) / wF;
		double between = wB * wF * sarflood::sq(mB - mF);
		if(between > best) {
			best = between;
			bestK = k;
		}
	}

	return stats.min + (bestK + 1) * width;
}

double sarflood::flood::selectThreshold(const Band<float>& change, const Config& config) {
	if(config.thresholdMode == ThresholdMode::Fixed)
		return config.fixedThresholdDb;
	double t = otsuThreshold(change, config.histogramBins);
	sf_info("Automatic threshold: " << t << " dB");
	return t;
}

Band<uint8_t> sarflood::flood::classify(const Band<float>& change, double threshold) {
	GridProps props = plainProps(change.props());
	props.setNoData(MASK_UNKNOWN);
	Band<uint8_t> mask(props);

	size_t valid = 0;
	size_t size = props.size();
	for(size_t i = 0; i < size; ++i) {
		float v = change.get(i);
		if(change.isNoData(v)) {
			mask.set(i, MASK_UNKNOWN);
		} else {
			mask.set(i, v > threshold ? MASK_FLOODED : MASK_DRY);
			++valid;
		}
	}

	if(!valid)
		sf_err(EmptyInputError, "The change raster has no valid pixels to classify.");

	return mask;
}

Band<uint8_t> sarflood::flood::cleanMask(const Band<uint8_t>& mask, int minRegionSize, int holeFillSize) {
	Band<uint8_t> out(mask);
	const GridProps& props = out.props();
	int cols = props.cols();
	int rows = props.rows();
	int minc, minr, maxc, maxr, area;

	if(minRegionSize > 0) {
		Band<int> labels(plainProps(props));
		int id = 0;
		int removed = 0;
		for(int r = 0; r < rows; ++r) {
			for(int c = 0; c < cols; ++c) {
				if(out.get(c, r) != MASK_FLOODED || labels.get(c, r) != 0)
					continue;
				TargetFillOperator<uint8_t, int> op(&out, &labels, MASK_FLOODED, ++id);
				Band<uint8_t>::floodFill(c, r, op, true, &minc, &minr, &maxc, &maxr, &area);
				if(area < minRegionSize) {
					relabel(out, labels, id, minc, minr, maxc, maxr, MASK_DRY);
					++removed;
				}
			}
		}
		sf_debug("Removed " << removed << " of " << id << " flooded regions smaller than " << minRegionSize << " px.");
	}

	if(holeFillSize > 0) {
		Band<int> labels(plainProps(props));
		int id = 0;
		int filled = 0;
		for(int r = 0; r < rows; ++r) {
			for(int c = 0; c < cols; ++c) {
				if(out.get(c, r) != MASK_DRY || labels.get(c, r) != 0)
					continue;
				TargetFillOperator<uint8_t, int> op(&out, &labels, MASK_DRY, ++id);
				Band<uint8_t>::floodFill(c, r, op, true, &minc, &minr, &maxc, &maxr, &area);
				if(area > holeFillSize || minc == 0 || minr == 0 || maxc == cols - 1 || maxr == rows - 1)
					continue;
				// A hole must be enclosed by flooded pixels only.
				bool enclosed = true;
				for(int rr = minr; enclosed && rr <= maxr; ++rr) {
					for(int cc = minc; enclosed && cc <= maxc; ++cc) {
						if(labels.get(cc, rr) == id && touches(out, cc, rr, MASK_UNKNOWN))
							enclosed = false;
					}
				}
				if(enclosed) {
					relabel(out, labels, id, minc, minr, maxc, maxr, MASK_FLOODED);
					++filled;
				}
			}
		}
		sf_debug("Filled " << filled << " holes of at most " << holeFillSize << " px.");
	}

	return out;
}

std::vector<FloodPolygon> sarflood::flood::vectorize(const Band<uint8_t>& mask, bool repair) {
	std::vector<FloodPolygon> polygons;
	if(!mask.count(MASK_FLOODED))
		return polygons;

	// A binary copy that also serves as its own mask, so only flooded cells are traced.
	const GridProps& props = mask.props();
	Band<uint8_t> bin(plainProps(props));
	size_t size = props.size();
	for(size_t i = 0; i < size; ++i)
		bin.set(i, mask.get(i) == MASK_FLOODED ? 1 : 0);

	DatasetPtr rds = bin.toDataset();
	GDALRasterBand* band = rds->GetRasterBand(1);

	// Newer GDAL folds the Memory driver into MEM.
	GDALDriver* drv = GetGDALDriverManager()->GetDriverByName("Memory");
	if(!drv)
		drv = GetGDALDriverManager()->GetDriverByName("MEM");
	if(!drv)
		sf_runerr("No in-memory vector driver is available.");
	DatasetPtr vds(drv->Create("", 0, 0, 0, GDT_Unknown, nullptr));
	if(!vds)
		sf_runerr("Failed to create in-memory vector dataset.");

	OGRSpatialReference sr;
	OGRSpatialReference* srp = nullptr;
	if(!props.projection().empty()) {
		if(OGRERR_NONE != sr.importFromWkt(props.projection().c_str()))
			sf_err(ConfigurationError, "The raster CRS could not be parsed.");
		sr.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		srp = &sr;
	}

	OGRLayer* lyr = vds->CreateLayer("flood", srp, wkbPolygon, nullptr);
	if(!lyr)
		sf_runerr("Failed to create polygon layer.");
	OGRFieldDefn field("value", OFTInteger);
	if(OGRERR_NONE != lyr->CreateField(&field))
		sf_runerr("Failed to create polygon value field.");

	char** opts = CSLSetNameValue(nullptr, "8CONNECTED", "8");
	CPLErr err = GDALPolygonize((GDALRasterBandH) band, (GDALRasterBandH) band, (OGRLayerH) lyr, 0, opts, nullptr, nullptr);
	CSLDestroy(opts);
	if(err != CE_None)
		sf_runerr("Failed to polygonize the flood mask.");

	int id = 0;
	lyr->ResetReading();
	OGRFeatureUniquePtr feat;
	while((feat = OGRFeatureUniquePtr(lyr->GetNextFeature()))) {
		if(feat->GetFieldAsInteger(0) != 1)
			continue;
		++id;
		std::stringstream label;
		label << "Flood polygon " << id;
		bool repaired = false;
		std::unique_ptr<OGRGeometry> geom = checkGeometry(std::unique_ptr<OGRGeometry>(feat->StealGeometry()),
				repair, label.str(), &repaired);
		polygons.emplace_back(id, std::move(geom), repaired);
	}

	sf_debug("Vectorized " << polygons.size() << " flood polygons.");
	return polygons;
}

std::unique_ptr<OGRGeometry> sarflood::flood::checkGeometry(std::unique_ptr<OGRGeometry> geom, bool repair,
		const std::string& label, bool* repaired) {
	if(repaired)
		*repaired = false;
	if(!geom)
		sf_err(InvalidGeometryError, label << " has no geometry.");
	if(geom->IsValid())
		return geom;
	if(!repair)
		sf_err(InvalidGeometryError, label << " is invalid and geometry repair is disabled.");
	std::unique_ptr<OGRGeometry> fixed(geom->MakeValid());
	if(!fixed || !fixed->IsValid())
		sf_err(InvalidGeometryError, label << " is invalid and could not be repaired.");
	sf_warn(label << " was invalid and has been repaired.");
	if(repaired)
		*repaired = true;
	return fixed;
}


FloodResult::FloodResult() :
	threshold(0),
	validPixels(0),
	floodedPixels(0),
	repairs(0) {
}


Flood::Flood(const Config& config, FloodOutput* output) :
	m_config(config),
	m_output(output) {
}

const Config& Flood::config() const {
	return m_config;
}

void Flood::validateInputs() {

	sf_debug("Checking...");

	m_config.validate();

	if(m_config.reference.empty())
		sf_err(ConfigurationError, "Reference raster not given.");

	if(!sarflood::util::isfile(m_config.reference))
		sf_err(ConfigurationError, "Reference raster " << m_config.reference << " not found.");

	if(m_config.flood.empty())
		sf_err(ConfigurationError, "Flood raster not given.");

	if(!sarflood::util::isfile(m_config.flood))
		sf_err(ConfigurationError, "Flood raster " << m_config.flood << " not found.");

	if(!m_config.urban.empty() && !sarflood::util::isfile(m_config.urban))
		sf_err(ConfigurationError, "Urban extent file " << m_config.urban << " not found.");

	if(!m_config.aoi.empty() && !sarflood::util::isfile(m_config.aoi))
		sf_err(ConfigurationError, "AOI file " << m_config.aoi << " not found.");

	if(!m_config.regions.empty() && !sarflood::util::isfile(m_config.regions))
		sf_err(ConfigurationError, "Regions file " << m_config.regions << " not found.");

	if(!m_output)
		sf_err(ConfigurationError, "No output configured.");

	if(!m_output->valid())
		sf_err(ConfigurationError, "The output configuration is not valid.");

	m_output->prepare();
}

FloodResult Flood::process(const Scene& ref, const Scene& flood,
		const RegionSet& urban, const RegionSet& aoi, const RegionSet& regions) const {

	checkGrids(ref, flood);

	for(int b = 1; b <= ref.bandCount(); ++b) {
		BandStats rs = computeStats(ref.band(b));
		BandStats fs = computeStats(flood.band(b));
		sf_debug("Band " << b << " reference: min=" << rs.min << ", max=" << rs.max << ", mean=" << rs.mean << " dB");
		sf_debug("Band " << b << " flood: min=" << fs.min << ", max=" << fs.max << ", mean=" << fs.mean << " dB");
	}

	FloodResult result;
	result.props = ref.props();

	sf_debug("Computing change (" << bandPolicyName(m_config.bandPolicy) << ")...");
	result.change = computeChange(ref, flood, m_config.bandPolicy, m_config.band, m_config.bandWeights);
	BandStats cs = computeStats(result.change);
	sf_debug("Change: min=" << cs.min << ", max=" << cs.max << ", mean=" << cs.mean << " dB");
	result.validPixels = cs.count;

	result.threshold = selectThreshold(result.change, m_config);

	sf_debug("Classifying at " << result.threshold << " dB...");
	Band<uint8_t> mask = classify(result.change, result.threshold);

	sf_debug("Cleaning...");
	result.mask = cleanMask(mask, m_config.minRegionSizePx, m_config.holeFillSizePx);
	result.floodedPixels = result.mask.count(MASK_FLOODED);
	sf_info("Flooded pixels: " << result.floodedPixels << " / " << result.validPixels);

	sf_debug("Vectorizing...");
	result.polygons = vectorize(result.mask, m_config.repairGeometry);
	for(const FloodPolygon& p : result.polygons) {
		if(p.repaired())
			++result.repairs;
	}
	if(result.repairs)
		sf_warn(result.repairs << " flood polygons were repaired.");

	sf_debug("Intersecting...");
	Intersector isect(m_config.outputCrs, result.props, m_config.repairGeometry, m_config.threads);
	result.intersection = isect.intersect(result.polygons, result.props, urban, aoi, m_config.aoiBufferM, regions);

	result.stats = aggregate(result.intersection);
	StatRecord& total = result.stats.back();
	total.validPixels = result.validPixels;
	total.floodedPixels = result.floodedPixels;
	total.threshold = result.threshold;
	sf_info("Flooded area: " << total.floodedKm2() << " km2 (" << total.floodedHa() << " ha)");

	return result;
}

FloodResult Flood::flood() {

	sf_debug("Flooding...");

	validateInputs();

	// Vector inputs first: configuration errors in them must surface before rasters are read.
	RegionSet urban;
	RegionSet aoi;
	RegionSet regions;
	if(!m_config.urban.empty())
		urban = RegionSet::load(m_config.urban);
	if(!m_config.aoi.empty())
		aoi = RegionSet::load(m_config.aoi);
	if(!m_config.regions.empty()) {
		regions = RegionSet::load(m_config.regions, m_config.regionIdField,
				m_config.regionNameField, m_config.regionAreaField, true);
		regions.checkIds();
	}

	Scene ref = Scene::load(m_config.reference);
	Scene fld = Scene::load(m_config.flood);

	FloodResult result = process(ref, fld, urban, aoi, regions);

	m_output->save(result);

	return result;
}
