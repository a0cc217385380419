/*
 * regions.cpp
 *
 *  Created on: Oct 5, 2026
 *      Author: rob
 */

#include <cmath>
#include <set>
#include <queue>
#include <thread>
#include <mutex>
#include <exception>

#include <ogr_api.h>
#include <ogrsf_frmts.h>

#include "flood.hpp"

using namespace sarflood::flood;

namespace {

	std::mutex s_ctMtx;	///<! Guards creation of coordinate transformations.

	class TransformDeleter {
	public:
		void operator()(OGRCoordinateTransformation* ct) const {
			OGRCoordinateTransformation::DestroyCT(ct);
		}
	};

	typedef std::unique_ptr<OGRCoordinateTransformation, TransformDeleter> TransformPtr;

	TransformPtr createTransform(const OGRSpatialReference& src, const OGRSpatialReference& dst) {
		std::lock_guard<std::mutex> lock(s_ctMtx);
		return TransformPtr(OGRCreateCoordinateTransformation(&src, &dst));
	}

	/**
	 * \brief Add the polygonal parts of the geometry to the multipolygon.
	 */
	void collectPolygons(const OGRGeometry* geom, OGRMultiPolygon& out) {
		if(!geom || geom->IsEmpty())
			return;
		const OGRPolygon* poly = dynamic_cast<const OGRPolygon*>(geom);
		if(poly) {
			if(OGRERR_NONE != out.addGeometry(poly))
				sf_err(sarflood::InvalidGeometryError, "Failed to collect a polygon.");
			return;
		}
		const OGRGeometryCollection* coll = dynamic_cast<const OGRGeometryCollection*>(geom);
		if(coll) {
			for(int i = 0; i < coll->getNumGeometries(); ++i)
				collectPolygons(coll->getGeometryRef(i), out);
		}
	}

	/**
	 * \brief Intersects regions taken from a shared queue until it is empty or another
	 * worker has failed. The first failure is kept for the caller.
	 */
	void regionWorker(const Intersector* isect, const OGRGeometry* total, const RegionSet* regions,
			std::queue<size_t>* jobs, std::vector<RegionResult>* results,
			std::mutex* mtx, std::exception_ptr* error) {

		while(true) {
			size_t idx;
			{
				std::lock_guard<std::mutex> lock(*mtx);
				if(*error || jobs->empty())
					return;
				idx = jobs->front();
				jobs->pop();
			}
			try {
				(*results)[idx] = isect->intersectRegion(*total, regions->region(idx), regions->projection());
			} catch(...) {
				std::lock_guard<std::mutex> lock(*mtx);
				if(!*error)
					*error = std::current_exception();
				return;
			}
		}
	}

} // anon


Region::Region(const std::string& id, const std::string& name, std::unique_ptr<OGRGeometry> geom, double area) :
	m_id(id),
	m_name(name),
	m_geom(std::move(geom)),
	m_area(area) {
	if(!m_geom)
		m_geom.reset(new OGRMultiPolygon());
}

const std::string& Region::id() const {
	return m_id;
}

const std::string& Region::name() const {
	return m_name;
}

const OGRGeometry& Region::geometry() const {
	return *m_geom;
}

bool Region::hasArea() const {
	return !std::isnan(m_area);
}

double Region::area() const {
	return m_area;
}


RegionSet::RegionSet() {
}

RegionSet::RegionSet(const std::string& source, const std::string& projection) :
	m_source(source),
	m_projection(projection) {
}

RegionSet RegionSet::load(const std::string& filename, const std::string& idField,
		const std::string& nameField, const std::string& areaField, bool requireId) {

	sf_debug("Loading regions from " << filename);

	DatasetPtr ds((GDALDataset*) GDALOpenEx(filename.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
	if(!ds)
		sf_err(ConfigurationError, "Failed to open vector file " << filename << ".");
	if(ds->GetLayerCount() < 1)
		sf_err(ConfigurationError, "Vector file " << filename << " has no layers.");

	OGRLayer* lyr = ds->GetLayer(0);

	std::string wkt;
	const OGRSpatialReference* sr = lyr->GetSpatialRef();
	if(sr) {
		char* out = nullptr;
		if(OGRERR_NONE == sr->exportToWkt(&out) && out)
			wkt = out;
		CPLFree(out);
	}
	if(wkt.empty()) {
		sf_warn("Vector file " << filename << " has no CRS; assuming WGS84.");
		OGRSpatialReference wgs;
		wgs.SetWellKnownGeogCS("WGS84");
		char* out = nullptr;
		wgs.exportToWkt(&out);
		wkt = out ? out : "";
		CPLFree(out);
	}

	OGRFeatureDefn* defn = lyr->GetLayerDefn();

	int idIdx = idField.empty() ? -1 : defn->GetFieldIndex(idField.c_str());
	if(idIdx < 0 && requireId)
		sf_err(ConfigurationError, "The ID field '" << idField << "' is not in " << filename << ".");

	int nameIdx = -1;
	if(!nameField.empty()) {
		nameIdx = defn->GetFieldIndex(nameField.c_str());
		if(nameIdx < 0)
			sf_warn("The name field '" << nameField << "' is not in " << filename << "; using IDs as names.");
	}

	int areaIdx = -1;
	if(!areaField.empty()) {
		areaIdx = defn->GetFieldIndex(areaField.c_str());
		if(areaIdx < 0)
			sf_err(ConfigurationError, "The area field '" << areaField << "' is not in " << filename << ".");
	}

	RegionSet regions(filename, wkt);

	lyr->ResetReading();
	OGRFeatureUniquePtr feat;
	while((feat = OGRFeatureUniquePtr(lyr->GetNextFeature()))) {
		std::string id = idIdx >= 0 ? sarflood::util::trim(feat->GetFieldAsString(idIdx)) : std::to_string(feat->GetFID());
		std::unique_ptr<OGRGeometry> geom(feat->StealGeometry());
		if(!geom || geom->IsEmpty()) {
			sf_warn("Feature " << id << " in " << filename << " has no geometry; it covers no area.");
			geom.reset(new OGRMultiPolygon());
		}
		std::string name = nameIdx >= 0 ? feat->GetFieldAsString(nameIdx) : id;
		double area = std::numeric_limits<double>::quiet_NaN();
		if(areaIdx >= 0 && feat->IsFieldSetAndNotNull(areaIdx))
			area = feat->GetFieldAsDouble(areaIdx);
		regions.add(Region(id, name, std::move(geom), area));
	}

	if(regions.empty())
		sf_warn("No features were loaded from " << filename << ".");

	sf_debug("Loaded " << regions.size() << " features.");
	return regions;
}

void RegionSet::add(Region&& region) {
	m_regions.push_back(std::move(region));
}

void RegionSet::checkIds() const {
	std::set<std::string> seen;
	for(const Region& r : m_regions) {
		if(r.id().empty())
			sf_err(ConfigurationError, "A region in " << m_source << " has an empty ID.");
		if(r.id() == TOTAL_REGION_ID)
			sf_err(ConfigurationError, "The region ID '" << TOTAL_REGION_ID << "' in " << m_source << " is reserved.");
		if(!seen.insert(r.id()).second)
			sf_err(ConfigurationError, "The region ID '" << r.id() << "' appears more than once in " << m_source << ".");
	}
}

const std::string& RegionSet::source() const {
	return m_source;
}

const std::string& RegionSet::projection() const {
	return m_projection;
}

size_t RegionSet::size() const {
	return m_regions.size();
}

bool RegionSet::empty() const {
	return m_regions.empty();
}

const Region& RegionSet::region(size_t idx) const {
	return m_regions.at(idx);
}


RegionResult::RegionResult() :
	floodedArea(0),
	regionArea(0) {
}

IntersectResult::IntersectResult() :
	totalArea(0),
	extentArea(0) {
}


StatRecord::StatRecord(const std::string& regionId, const std::string& name,
		double floodedArea, double regionArea, bool aggregate) :
	regionId(regionId),
	name(name),
	floodedArea(floodedArea),
	regionArea(regionArea),
	floodedFraction(sarflood::flood::floodedFraction(floodedArea, regionArea)),
	aggregate(aggregate),
	validPixels(0),
	floodedPixels(0),
	threshold(std::numeric_limits<double>::quiet_NaN()) {
}

double StatRecord::floodedHa() const {
	return floodedArea / 10000.0;
}

double StatRecord::floodedKm2() const {
	return floodedArea / 1000000.0;
}

double sarflood::flood::floodedFraction(double flooded, double total) {
	if(!(total > 0))
		return std::numeric_limits<double>::quiet_NaN();
	return sarflood::max(0.0, sarflood::min(1.0, flooded / total));
}


double sarflood::flood::geometryArea(const OGRGeometry& geom) {
	return OGR_G_Area(OGRGeometry::ToHandle(const_cast<OGRGeometry*>(&geom)));
}

std::unique_ptr<OGRMultiPolygon> sarflood::flood::toMultiPolygon(const OGRGeometry& geom) {
	std::unique_ptr<OGRMultiPolygon> out(new OGRMultiPolygon());
	collectPolygons(&geom, *out);
	if(geom.getSpatialReference())
		out->assignSpatialReference(geom.getSpatialReference());
	return out;
}

std::unique_ptr<OGRGeometry> sarflood::flood::reproject(const OGRGeometry& geom, const std::string& srcWkt,
		const OGRSpatialReference& dst) {

	OGRSpatialReference src;
	if(srcWkt.empty() || OGRERR_NONE != src.importFromWkt(srcWkt.c_str()))
		sf_err(ConfigurationError, "A geometry has no usable CRS.");
	src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

	std::unique_ptr<OGRGeometry> out(geom.clone());
	if(out->IsEmpty() || src.IsSame(&dst)) {
		out->assignSpatialReference(&dst);
		return out;
	}

	TransformPtr ct = createTransform(src, dst);
	if(!ct)
		sf_err(ConfigurationError, "No transformation is available between the geometry CRS and the target CRS.");
	if(OGRERR_NONE != out->transform(ct.get()))
		sf_err(InvalidGeometryError, "A geometry could not be transformed to the target CRS.");
	return out;
}


Intersector::Intersector(const std::string& crs, const GridProps& props, bool repair, int threads) :
	m_repair(repair),
	m_threads(threads) {

	if(crs.empty() || sarflood::util::lowercase(crs) == "auto") {
		// The WGS84 UTM zone containing the centre of the grid.
		OGRSpatialReference src;
		if(props.projection().empty() || OGRERR_NONE != src.importFromWkt(props.projection().c_str()))
			sf_err(ConfigurationError, "The raster has no CRS; an output CRS cannot be chosen automatically.");
		src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		OGRSpatialReference wgs;
		wgs.SetWellKnownGeogCS("WGS84");
		wgs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		double x = props.toX(props.cols() / 2.0, props.rows() / 2.0);
		double y = props.toY(props.rows() / 2.0, props.cols() / 2.0);
		TransformPtr ct = createTransform(src, wgs);
		if(!ct || !ct->Transform(1, &x, &y))
			sf_err(ConfigurationError, "The raster centre could not be transformed to WGS84.");
		int zone = (int) std::floor((x + 180.0) / 6.0) + 1;
		zone = sarflood::max(1, sarflood::min(60, zone));
		int epsg = (y >= 0 ? 32600 : 32700) + zone;
		if(OGRERR_NONE != m_target.importFromEPSG(epsg))
			sf_err(ConfigurationError, "Failed to load EPSG:" << epsg << ".");
		sf_info("Using EPSG:" << epsg << " for area computation.");
	} else {
		if(OGRERR_NONE != m_target.SetFromUserInput(crs.c_str()))
			sf_err(ConfigurationError, "The output CRS '" << crs << "' is not recognized.");
		if(!m_target.IsProjected())
			sf_err(ConfigurationError, "The output CRS '" << crs << "' is not projected; areas need a projected CRS.");
	}
	m_target.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
}

const OGRSpatialReference& Intersector::target() const {
	return m_target;
}

std::string Intersector::targetWkt() const {
	char* out = nullptr;
	std::string wkt;
	if(OGRERR_NONE == m_target.exportToWkt(&out) && out)
		wkt = out;
	CPLFree(out);
	return wkt;
}

std::unique_ptr<OGRGeometry> Intersector::project(const OGRGeometry& geom, const std::string& srcWkt) const {
	return reproject(geom, srcWkt, m_target);
}

std::unique_ptr<OGRGeometry> Intersector::extent(const RegionSet& regions, double buffer) const {
	if(regions.empty())
		return nullptr;

	OGRMultiPolygon parts;
	for(size_t i = 0; i < regions.size(); ++i) {
		const Region& region = regions.region(i);
		if(region.geometry().IsEmpty())
			continue;
		std::unique_ptr<OGRGeometry> geom = project(region.geometry(), regions.projection());
		if(buffer > 0) {
			geom.reset(geom->Buffer(buffer));
			if(!geom)
				sf_err(InvalidGeometryError, "Failed to buffer feature " << region.id() << " of " << regions.source() << ".");
		}
		geom = checkGeometry(std::move(geom), m_repair, "Feature " + region.id() + " of " + regions.source());
		collectPolygons(geom.get(), parts);
	}

	if(parts.IsEmpty()) {
		sf_warn(regions.source() << " has no polygonal area; nothing will be counted inside it.");
		std::unique_ptr<OGRGeometry> empty(new OGRMultiPolygon());
		empty->assignSpatialReference(&m_target);
		return empty;
	}

	std::unique_ptr<OGRGeometry> merged(parts.UnionCascaded());
	if(!merged)
		sf_err(InvalidGeometryError, "Failed to merge the features of " << regions.source() << ".");
	merged->assignSpatialReference(&m_target);
	return toMultiPolygon(*merged);
}

std::unique_ptr<OGRGeometry> Intersector::footprint(const GridProps& props) const {
	double c[4] = {0, (double) props.cols(), (double) props.cols(), 0};
	double r[4] = {0, 0, (double) props.rows(), (double) props.rows()};
	OGRLinearRing ring;
	for(int i = 0; i < 4; ++i)
		ring.addPoint(props.toX(c[i], r[i]), props.toY(r[i], c[i]));
	ring.closeRings();
	std::unique_ptr<OGRPolygon> poly(new OGRPolygon());
	poly->addRing(&ring);
	return project(*poly, props.projection());
}

IntersectResult Intersector::intersect(const std::vector<FloodPolygon>& polygons, const GridProps& props,
		const RegionSet& urban, const RegionSet& aoi, double aoiBuffer,
		const RegionSet& regions) const {

	IntersectResult result;
	result.projection = targetWkt();

	OGRMultiPolygon parts;
	for(const FloodPolygon& p : polygons) {
		std::unique_ptr<OGRGeometry> geom = project(p.geometry(), props.projection());
		collectPolygons(geom.get(), parts);
		result.polygons.emplace_back(p.id(), std::move(geom), p.repaired());
	}

	// The counting extent: urban areas, within the buffered AOI if one is given.
	std::unique_ptr<OGRGeometry> clip;
	std::unique_ptr<OGRGeometry> urbanExt = extent(urban);
	std::unique_ptr<OGRGeometry> aoiExt = extent(aoi, aoiBuffer);
	if(urbanExt && aoiExt) {
		clip.reset(urbanExt->Intersection(aoiExt.get()));
		if(!clip)
			sf_err(InvalidGeometryError, "Failed to intersect the urban extent with the AOI.");
		clip = toMultiPolygon(*clip);
	} else if(urbanExt) {
		clip = std::move(urbanExt);
	} else if(aoiExt) {
		clip = std::move(aoiExt);
	}

	std::unique_ptr<OGRGeometry> all;
	if(!parts.IsEmpty()) {
		all.reset(parts.UnionCascaded());
		if(!all)
			sf_err(InvalidGeometryError, "Failed to merge the flood polygons.");
		if(clip) {
			all.reset(all->Intersection(clip.get()));
			if(!all)
				sf_err(InvalidGeometryError, "Failed to clip the flood polygons to the urban extent.");
		}
	}

	if(all) {
		result.total = toMultiPolygon(*all);
	} else {
		result.total.reset(new OGRMultiPolygon());
	}
	result.total->assignSpatialReference(&m_target);
	result.totalArea = geometryArea(*result.total);
	result.extentArea = clip ? geometryArea(*clip) : geometryArea(*footprint(props));

	if(regions.empty())
		return result;

	result.regions.resize(regions.size());
	int threads = sarflood::min(m_threads, (int) regions.size());
	if(threads <= 1) {
		for(size_t i = 0; i < regions.size(); ++i)
			result.regions[i] = intersectRegion(*result.total, regions.region(i), regions.projection());
	} else {
		sf_debug("Intersecting " << regions.size() << " regions with " << threads << " threads.");

		// Each worker gets its own CRS and geometry copies; OGR objects are not shared across threads.
		std::vector<std::unique_ptr<Intersector>> isects;
		std::vector<std::unique_ptr<OGRGeometry>> totals;
		for(int i = 0; i < threads; ++i) {
			isects.emplace_back(new Intersector(*this));
			totals.emplace_back(result.total->clone());
		}

		std::queue<size_t> jobs;
		for(size_t i = 0; i < regions.size(); ++i)
			jobs.push(i);

		std::mutex mtx;
		std::exception_ptr error;
		std::vector<std::thread> ts;
		for(int i = 0; i < threads; ++i)
			ts.emplace_back(regionWorker, isects[i].get(), totals[i].get(), &regions, &jobs, &result.regions, &mtx, &error);
		for(std::thread& t : ts)
			t.join();

		if(error)
			std::rethrow_exception(error);
	}

	return result;
}

RegionResult Intersector::intersectRegion(const OGRGeometry& total, const Region& region,
		const std::string& projection) const {

	RegionResult result;
	result.id = region.id();
	result.name = region.name();

	std::unique_ptr<OGRGeometry> geom;
	if(region.geometry().IsEmpty()) {
		geom.reset(new OGRMultiPolygon());
	} else {
		geom = checkGeometry(project(region.geometry(), projection), m_repair, "Region " + region.id());
	}
	result.regionArea = region.hasArea() ? region.area() : geometryArea(*geom);

	if(total.IsEmpty() || geom->IsEmpty()) {
		result.flood.reset(new OGRMultiPolygon());
	} else {
		std::unique_ptr<OGRGeometry> isect(total.Intersection(geom.get()));
		if(!isect)
			sf_err(InvalidGeometryError, "Failed to intersect region " << region.id() << " with the flood extent.");
		result.flood = toMultiPolygon(*isect);
	}
	result.flood->assignSpatialReference(&m_target);
	result.floodedArea = geometryArea(*result.flood);

	if(!(result.regionArea > 0))
		sf_warn("Region " << region.id() << " has no area; its flooded fraction is undefined.");

	return result;
}


std::vector<StatRecord> sarflood::flood::aggregate(const IntersectResult& result) {
	std::vector<StatRecord> stats;
	for(const RegionResult& r : result.regions)
		stats.emplace_back(r.id, r.name, r.floodedArea, r.regionArea);
	stats.emplace_back(TOTAL_REGION_ID, "Total", result.totalArea, result.extentArea, true);
	return stats;
}
