#include "sarflood.hpp"
#include "grid.hpp"
#include "flood.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include <unistd.h>

#include <gdal_priv.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>

using namespace sarflood::flood;
using namespace sarflood::flood::util;
using namespace sarflood::grid;

static int g_failures = 0;

#define EXPECT_TRUE(cond) \
	do { \
		if(!(cond)) { \
			++g_failures; \
			std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n"; \
		} \
	} while(0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b) \
	do { \
		const auto _a = (a); \
		const auto _b = (b); \
		if(!(_a == _b)) { \
			++g_failures; \
			std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n"; \
		} \
	} while(0)

#define EXPECT_NEAR(a, b, tol) \
	do { \
		const double _a = (a); \
		const double _b = (b); \
		if(!(std::abs(_a - _b) <= (tol))) { \
			++g_failures; \
			std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " (" << _a << ") ~ " \
					<< #b << " (" << _b << ")\n"; \
		} \
	} while(0)

#define EXPECT_THROW(stmt, type) \
	do { \
		bool _caught = false; \
		try { \
			stmt; \
		} catch(const type&) { \
			_caught = true; \
		} catch(const std::exception& _e) { \
			std::cerr << __FILE__ << ":" << __LINE__ << " unexpected exception: " << _e.what() << "\n"; \
		} \
		if(!_caught) { \
			++g_failures; \
			std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_THROW failed: " << #stmt << "\n"; \
		} \
	} while(0)

#define ASSERT_TRUE(cond) \
	do { \
		if(!(cond)) { \
			++g_failures; \
			std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n"; \
			return; \
		} \
	} while(0)

// 10 m pixels in UTM zone 52N; the top-left corner is at (500000, 4000000).
static const double kTlx = 500000.0;
static const double kTly = 4000000.0;
static const double kRes = 10.0;

static std::string WktFromEpsg(int epsg) {
	OGRSpatialReference sr;
	sr.importFromEPSG(epsg);
	char* out = nullptr;
	sr.exportToWkt(&out);
	std::string wkt = out ? out : "";
	CPLFree(out);
	return wkt;
}

static GridProps MakeProps(int cols, int rows) {
	GridProps props;
	props.setSize(cols, rows);
	props.setTrans(kTlx, kTly, kRes, -kRes);
	props.setProjection(WktFromEpsg(32652));
	return props;
}

static Band<float> MakeBand(int cols, int rows, float value) {
	Band<float> band(MakeProps(cols, rows));
	band.fill(value);
	return band;
}

static Scene MakeScene(const std::string& name, const Band<float>& band) {
	return Scene(name, std::vector<Band<float>>(1, band));
}

static Band<uint8_t> MakeMask(int cols, int rows, uint8_t value) {
	GridProps props = MakeProps(cols, rows);
	props.setNoData(MASK_UNKNOWN);
	Band<uint8_t> mask(props);
	mask.fill(value);
	return mask;
}

static void SetBlock(Band<uint8_t>& mask, int c0, int r0, int c1, int r1, uint8_t value) {
	for(int r = r0; r <= r1; ++r)
		for(int c = c0; c <= c1; ++c)
			mask.set(c, r, value);
}

// The rectangle covering grid columns c0..c1 and rows r0..r1 (inclusive cell edges), in the grid CRS.
static std::unique_ptr<OGRGeometry> CellRect(int c0, int r0, int c1, int r1) {
	double x0 = kTlx + c0 * kRes;
	double x1 = kTlx + (c1 + 1) * kRes;
	double y0 = kTly - (r1 + 1) * kRes;
	double y1 = kTly - r0 * kRes;
	OGRLinearRing ring;
	ring.addPoint(x0, y0);
	ring.addPoint(x1, y0);
	ring.addPoint(x1, y1);
	ring.addPoint(x0, y1);
	ring.closeRings();
	std::unique_ptr<OGRPolygon> poly(new OGRPolygon());
	poly->addRing(&ring);
	return std::unique_ptr<OGRGeometry>(poly.release());
}

static std::unique_ptr<OGRGeometry> FromWkt(const char* wkt) {
	OGRGeometry* geom = nullptr;
	OGRGeometryFactory::createFromWkt(wkt, nullptr, &geom);
	return std::unique_ptr<OGRGeometry>(geom);
}

static std::string MakeTempDir() {
	char tmpl[] = "/tmp/sarflood_test_XXXXXX";
	char* dir = mkdtemp(tmpl);
	return dir ? std::string(dir) : std::string();
}

// The 100x100 scene of 0 dB with a 10x10 block dropping to -5 dB at columns/rows 40..49.
static void MakeBlockScenes(Scene* ref, Scene* flood) {
	Band<float> r = MakeBand(100, 100, 0.0f);
	Band<float> f = MakeBand(100, 100, 0.0f);
	for(int row = 40; row < 50; ++row)
		for(int col = 40; col < 50; ++col)
			f.set(col, row, -5.0f);
	*ref = MakeScene("ref", r);
	*flood = MakeScene("flood", f);
}

static RegionSet CoveringRegion() {
	RegionSet regions("test", WktFromEpsg(32652));
	regions.add(Region("all", "Whole scene", CellRect(0, 0, 99, 99)));
	return regions;
}

static void TestEqualScenesAreNotFlooded() {
	Band<float> band = MakeBand(8, 6, 0.0f);
	for(int i = 0; i < 48; ++i)
		band.set((size_t) i, -20.0f + i * 0.5f);
	Scene ref = MakeScene("ref", band);
	Scene flood = MakeScene("flood", band);

	Band<float> change = computeChange(ref, flood, BandPolicy::Single);
	for(float v : change.data())
		EXPECT_EQ(v, 0.0f);

	Band<uint8_t> mask = classify(change, 3.0);
	EXPECT_EQ(mask.count(MASK_FLOODED), (size_t) 0);
	EXPECT_EQ(mask.count(MASK_DRY), (size_t) 48);

	// A change equal to the threshold is not flooded.
	Band<uint8_t> tie = classify(change, 0.0);
	EXPECT_EQ(tie.count(MASK_FLOODED), (size_t) 0);
}

static void TestNoDataPropagates() {
	Band<float> r = MakeBand(4, 4, -8.0f);
	Band<float> f = MakeBand(4, 4, -12.0f);
	r.props().setNoData(-9999.0);
	r.set(0, 0, -9999.0f);
	f.set(1, 0, std::nanf(""));

	Band<float> change = computeChange(MakeScene("ref", r), MakeScene("flood", f), BandPolicy::Single);
	EXPECT_EQ(change.get(0, 0), CHANGE_NODATA);
	EXPECT_EQ(change.get(1, 0), CHANGE_NODATA);
	EXPECT_NEAR(change.get(2, 0), 4.0, 1e-6);

	Band<uint8_t> mask = classify(change, 3.0);
	EXPECT_EQ(mask.get(0, 0), MASK_UNKNOWN);
	EXPECT_EQ(mask.get(1, 0), MASK_UNKNOWN);
	EXPECT_EQ(mask.get(2, 0), MASK_FLOODED);
	EXPECT_EQ(mask.count(MASK_FLOODED), (size_t) 14);
	EXPECT_TRUE(mask.props().nodataSet());
	EXPECT_EQ(mask.props().nodata(), 255.0);
}

static void TestBandPolicies() {
	std::vector<Band<float>> rb;
	rb.push_back(MakeBand(3, 3, -5.0f));
	rb.push_back(MakeBand(3, 3, -10.0f));
	std::vector<Band<float>> fb;
	fb.push_back(MakeBand(3, 3, -8.0f));
	fb.push_back(MakeBand(3, 3, -11.0f));
	Scene ref("ref", rb);
	Scene flood("flood", fb);

	EXPECT_NEAR(computeChange(ref, flood, BandPolicy::Single, 1).get(1, 1), 3.0, 1e-6);
	EXPECT_NEAR(computeChange(ref, flood, BandPolicy::Single, 2).get(1, 1), 1.0, 1e-6);
	EXPECT_NEAR(computeChange(ref, flood, BandPolicy::Sum).get(1, 1), 4.0, 1e-6);
	std::vector<double> weights = {0.5, 2.0};
	EXPECT_NEAR(computeChange(ref, flood, BandPolicy::Weighted, 1, weights).get(1, 1), 3.5, 1e-6);

	std::vector<double> one = {1.0};
	EXPECT_THROW(computeChange(ref, flood, BandPolicy::Weighted, 1, one), sarflood::ConfigurationError);
	EXPECT_THROW(computeChange(ref, flood, BandPolicy::Single, 3), sarflood::ConfigurationError);
}

static void TestGridMismatch() {
	Scene ref = MakeScene("ref", MakeBand(10, 10, 0.0f));

	EXPECT_THROW(checkGrids(ref, MakeScene("small", MakeBand(10, 9, 0.0f))), sarflood::GridMismatchError);

	Band<float> shifted = MakeBand(10, 10, 0.0f);
	shifted.props().setTrans(kTlx + 5, kTly, kRes, -kRes);
	EXPECT_THROW(checkGrids(ref, MakeScene("shifted", shifted)), sarflood::GridMismatchError);

	Band<float> other = MakeBand(10, 10, 0.0f);
	other.props().setProjection(WktFromEpsg(32651));
	EXPECT_THROW(computeChange(ref, MakeScene("other", other), BandPolicy::Single), sarflood::GridMismatchError);

	std::vector<Band<float>> two(2, MakeBand(10, 10, 0.0f));
	EXPECT_THROW(checkGrids(ref, Scene("two", two)), sarflood::GridMismatchError);

	// The nodata value is not part of the grid.
	Band<float> nd = MakeBand(10, 10, 0.0f);
	nd.props().setNoData(-1);
	checkGrids(ref, MakeScene("nodata", nd));
}

static void TestEmptyInput() {
	Band<float> change = MakeBand(5, 5, CHANGE_NODATA);
	change.props().setNoData(CHANGE_NODATA);
	EXPECT_THROW(classify(change, 3.0), sarflood::EmptyInputError);
	EXPECT_THROW(otsuThreshold(change), sarflood::EmptyInputError);
}

static void TestOtsu() {
	Band<float> change = MakeBand(20, 10, 0.0f);
	std::mt19937 rng(42);
	std::normal_distribution<float> noise(0.0f, 0.3f);
	for(int r = 0; r < 10; ++r)
		for(int c = 0; c < 20; ++c)
			change.set(c, r, (c < 10 ? 0.0f : 8.0f) + noise(rng));

	double t1 = otsuThreshold(change);
	double t2 = otsuThreshold(change);
	EXPECT_EQ(t1, t2);
	EXPECT_TRUE(t1 > 0.0 && t1 < 8.0);

	Band<uint8_t> mask = classify(change, t1);
	EXPECT_EQ(mask.count(MASK_FLOODED), (size_t) 100);
	for(int r = 0; r < 10; ++r)
		EXPECT_EQ(mask.get(15, r), MASK_FLOODED);

	Band<float> flat = MakeBand(4, 4, 2.5f);
	EXPECT_EQ(otsuThreshold(flat), 2.5);

	Config config;
	config.thresholdMode = ThresholdMode::Fixed;
	config.fixedThresholdDb = 1.25;
	EXPECT_EQ(selectThreshold(change, config), 1.25);
	config.thresholdMode = ThresholdMode::Automatic;
	EXPECT_EQ(selectThreshold(change, config), t1);
}

static void TestCleanRemovesSmallRegions() {
	Band<uint8_t> mask = MakeMask(20, 20, MASK_DRY);
	SetBlock(mask, 1, 1, 3, 3, MASK_FLOODED);		// 9 px
	SetBlock(mask, 10, 10, 15, 15, MASK_FLOODED);	// 36 px
	mask.set(7, 1, MASK_FLOODED);					// a diagonal pair
	mask.set(8, 2, MASK_FLOODED);
	mask.set(18, 1, MASK_UNKNOWN);

	Band<uint8_t> out = cleanMask(mask, 10, 0);
	EXPECT_EQ(out.count(MASK_FLOODED), (size_t) 36);
	EXPECT_EQ(out.get(2, 2), MASK_DRY);
	EXPECT_EQ(out.get(12, 12), MASK_FLOODED);
	EXPECT_EQ(out.get(18, 1), MASK_UNKNOWN);

	// Diagonal neighbours belong to one region.
	Band<uint8_t> pair = cleanMask(mask, 2, 0);
	EXPECT_EQ(pair.get(7, 1), MASK_FLOODED);
	EXPECT_EQ(pair.get(8, 2), MASK_FLOODED);
	Band<uint8_t> gone = cleanMask(mask, 3, 0);
	EXPECT_EQ(gone.get(7, 1), MASK_DRY);
	EXPECT_EQ(gone.get(8, 2), MASK_DRY);

	// The input is not modified.
	EXPECT_EQ(mask.count(MASK_FLOODED), (size_t) 47);
	EXPECT_TRUE(cleanMask(mask, 0, 0) == mask);
}

static void TestCleanFillsHoles() {
	Band<uint8_t> mask = MakeMask(20, 20, MASK_DRY);
	SetBlock(mask, 5, 5, 14, 14, MASK_FLOODED);
	SetBlock(mask, 9, 9, 10, 10, MASK_DRY);	// 4 px hole

	Band<uint8_t> filled = cleanMask(mask, 0, 4);
	EXPECT_EQ(filled.count(MASK_FLOODED), (size_t) 100);
	EXPECT_EQ(filled.get(0, 0), MASK_DRY);

	Band<uint8_t> kept = cleanMask(mask, 0, 3);
	EXPECT_EQ(kept.count(MASK_FLOODED), (size_t) 96);

	// A hole next to an unknown pixel is not enclosed by flooding.
	mask.set(9, 9, MASK_UNKNOWN);
	Band<uint8_t> unknown = cleanMask(mask, 0, 10);
	EXPECT_EQ(unknown.get(10, 10), MASK_DRY);
	EXPECT_EQ(unknown.get(9, 9), MASK_UNKNOWN);

	// Dry land on the grid edge is never a hole.
	Band<uint8_t> edge = MakeMask(6, 6, MASK_FLOODED);
	edge.set(0, 3, MASK_DRY);
	EXPECT_EQ(cleanMask(edge, 0, 10).get(0, 3), MASK_DRY);
}

static void TestCleanIsIdempotent() {
	std::mt19937 rng(1234);
	std::uniform_int_distribution<int> dist(0, 9);
	for(int trial = 0; trial < 20; ++trial) {
		Band<uint8_t> mask = MakeMask(30, 30, MASK_DRY);
		for(size_t i = 0; i < mask.props().size(); ++i) {
			int v = dist(rng);
			mask.set(i, v < 5 ? MASK_DRY : (v < 9 ? MASK_FLOODED : MASK_UNKNOWN));
		}
		int minSize = 1 + trial % 6;
		int holeSize = trial % 5;
		Band<uint8_t> once = cleanMask(mask, minSize, holeSize);
		Band<uint8_t> twice = cleanMask(once, minSize, holeSize);
		EXPECT_TRUE(once == twice);
		EXPECT_EQ(once.count(MASK_UNKNOWN), mask.count(MASK_UNKNOWN));
	}
}

static void TestVectorizeEmptyAndFull() {
	EXPECT_TRUE(vectorize(MakeMask(10, 10, MASK_DRY)).empty());
	EXPECT_TRUE(vectorize(MakeMask(10, 10, MASK_UNKNOWN)).empty());

	std::vector<FloodPolygon> full = vectorize(MakeMask(10, 10, MASK_FLOODED));
	ASSERT_TRUE(full.size() == 1);
	EXPECT_EQ(full[0].id(), 1);
	EXPECT_NEAR(full[0].area(), 100 * kRes * kRes, 1e-6);

	Band<uint8_t> two = MakeMask(10, 10, MASK_DRY);
	SetBlock(two, 0, 0, 2, 2, MASK_FLOODED);
	SetBlock(two, 5, 5, 9, 6, MASK_FLOODED);
	two.set(9, 0, MASK_UNKNOWN);
	std::vector<FloodPolygon> polys = vectorize(two);
	ASSERT_TRUE(polys.size() == 2);
	double area = polys[0].area() + polys[1].area();
	EXPECT_NEAR(area, 19 * kRes * kRes, 1e-6);
}

static void TestEndToEndBlock() {
	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);

	Config config;
	config.minRegionSizePx = 50;
	Flood f(config, nullptr);
	RegionSet none;
	FloodResult result = f.process(ref, flood, none, none, CoveringRegion());

	EXPECT_EQ(result.threshold, 3.0);
	EXPECT_EQ(result.floodedPixels, (size_t) 100);
	EXPECT_EQ(result.validPixels, (size_t) 10000);
	ASSERT_TRUE(result.polygons.size() == 1);
	EXPECT_NEAR(result.polygons[0].area(), 100 * kRes * kRes, 1e-6);

	ASSERT_TRUE(result.stats.size() == 2);
	const StatRecord& region = result.stats[0];
	EXPECT_EQ(region.regionId, std::string("all"));
	EXPECT_NEAR(region.floodedArea, 10000.0, 1e-6);
	EXPECT_NEAR(region.regionArea, 1000000.0, 1e-3);
	EXPECT_NEAR(region.floodedFraction, 0.01, 1e-9);
	EXPECT_NEAR(region.floodedHa(), 1.0, 1e-9);
	EXPECT_NEAR(region.floodedKm2(), 0.01, 1e-9);

	const StatRecord& total = result.stats[1];
	EXPECT_TRUE(total.aggregate);
	EXPECT_EQ(total.regionId, std::string(TOTAL_REGION_ID));
	EXPECT_NEAR(total.floodedArea, 10000.0, 1e-6);
	EXPECT_NEAR(total.regionArea, 1000000.0, 1e-3);
	EXPECT_EQ(total.floodedPixels, (size_t) 100);
	EXPECT_EQ(total.validPixels, (size_t) 10000);
	EXPECT_EQ(total.threshold, 3.0);
	EXPECT_TRUE(std::isnan(region.threshold));

	// The automatic threshold separates the block too.
	config.thresholdMode = ThresholdMode::Automatic;
	FloodResult automatic = Flood(config, nullptr).process(ref, flood, none, none, none);
	EXPECT_EQ(automatic.floodedPixels, (size_t) 100);
	EXPECT_TRUE(automatic.threshold > 0 && automatic.threshold < 5);
}

static void TestEndToEndBlockRemoved() {
	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);

	Config config;
	config.minRegionSizePx = 101;
	RegionSet none;
	FloodResult result = Flood(config, nullptr).process(ref, flood, none, none, CoveringRegion());

	EXPECT_EQ(result.floodedPixels, (size_t) 0);
	EXPECT_TRUE(result.polygons.empty());
	ASSERT_TRUE(result.stats.size() == 2);
	EXPECT_EQ(result.stats[0].floodedArea, 0.0);
	EXPECT_EQ(result.stats[0].floodedFraction, 0.0);
	EXPECT_EQ(result.stats[1].floodedArea, 0.0);
}

static void TestAutomaticCrs() {
	Intersector isect("auto", MakeProps(100, 100));
	const char* code = isect.target().GetAuthorityCode(nullptr);
	ASSERT_TRUE(code != nullptr);
	EXPECT_EQ(std::string(code), std::string("32652"));

	EXPECT_THROW(Intersector("EPSG:4326", MakeProps(10, 10)), sarflood::ConfigurationError);
	EXPECT_THROW(Intersector("not a crs", MakeProps(10, 10)), sarflood::ConfigurationError);

	std::unique_ptr<OGRGeometry> fp = isect.footprint(MakeProps(100, 100));
	EXPECT_NEAR(geometryArea(*fp), 1000000.0, 1e-3);
}

static void TestRegionPartition() {
	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);

	// Split down column 45, through the middle of the flooded block.
	RegionSet regions("halves", WktFromEpsg(32652));
	regions.add(Region("west", "West", CellRect(0, 0, 44, 99)));
	regions.add(Region("east", "East", CellRect(45, 0, 99, 99)));
	regions.add(Region("away", "Outside", CellRect(200, 200, 210, 210)));

	RegionSet none;
	Config config;
	FloodResult result = Flood(config, nullptr).process(ref, flood, none, none, regions);

	ASSERT_TRUE(result.stats.size() == 4);
	EXPECT_NEAR(result.stats[0].floodedArea, 5000.0, 1e-6);
	EXPECT_NEAR(result.stats[1].floodedArea, 5000.0, 1e-6);
	EXPECT_NEAR(result.stats[0].floodedArea + result.stats[1].floodedArea, result.stats[3].floodedArea, 1e-6);

	// A region with no flooding is still reported.
	EXPECT_EQ(result.stats[2].regionId, std::string("away"));
	EXPECT_EQ(result.stats[2].floodedArea, 0.0);
	EXPECT_EQ(result.stats[2].floodedFraction, 0.0);
}

static void TestUrbanClip() {
	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);

	// Urban area covering the top half of the block.
	RegionSet urban("urban", WktFromEpsg(32652));
	urban.add(Region("1", "1", CellRect(0, 0, 99, 44)));
	RegionSet none;
	Config config;
	FloodResult result = Flood(config, nullptr).process(ref, flood, urban, none, none);

	ASSERT_TRUE(result.stats.size() == 1);
	EXPECT_NEAR(result.stats[0].floodedArea, 5000.0, 1e-6);
	EXPECT_NEAR(result.stats[0].regionArea, 450000.0, 1e-3);
	// Polygons are not clipped; only the counted area is.
	ASSERT_TRUE(result.intersection.polygons.size() == 1);
	EXPECT_NEAR(result.intersection.polygons[0].area(), 10000.0, 1e-6);
}

static void TestZeroAreaRegion() {
	IntersectResult result;
	result.totalArea = 50;
	result.extentArea = 100;
	RegionResult r;
	r.id = "zero";
	r.floodedArea = 0;
	r.regionArea = 0;
	result.regions.push_back(std::move(r));

	std::vector<StatRecord> stats = aggregate(result);
	ASSERT_TRUE(stats.size() == 2);
	EXPECT_TRUE(std::isnan(stats[0].floodedFraction));
	EXPECT_NEAR(stats[1].floodedFraction, 0.5, 1e-12);

	EXPECT_TRUE(std::isnan(floodedFraction(1, 0)));
	EXPECT_EQ(floodedFraction(2, 1), 1.0);

	// A supplied area of zero wins over the geometry.
	Intersector isect("EPSG:32652", MakeProps(10, 10));
	Region region("z", "Z", CellRect(0, 0, 9, 9), 0.0);
	std::unique_ptr<OGRGeometry> total = CellRect(0, 0, 4, 4);
	RegionResult rr = isect.intersectRegion(*total, region, WktFromEpsg(32652));
	EXPECT_NEAR(rr.floodedArea, 2500.0, 1e-6);
	EXPECT_EQ(rr.regionArea, 0.0);
	EXPECT_TRUE(std::isnan(StatRecord(rr.id, rr.name, rr.floodedArea, rr.regionArea).floodedFraction));
}

static void TestRegionIds() {
	RegionSet dup("dup", WktFromEpsg(32652));
	dup.add(Region("a", "A", CellRect(0, 0, 1, 1)));
	dup.add(Region("a", "A2", CellRect(2, 2, 3, 3)));
	EXPECT_THROW(dup.checkIds(), sarflood::ConfigurationError);

	RegionSet reserved("reserved", WktFromEpsg(32652));
	reserved.add(Region(TOTAL_REGION_ID, "T", CellRect(0, 0, 1, 1)));
	EXPECT_THROW(reserved.checkIds(), sarflood::ConfigurationError);

	RegionSet empty("empty", WktFromEpsg(32652));
	empty.add(Region("", "E", CellRect(0, 0, 1, 1)));
	EXPECT_THROW(empty.checkIds(), sarflood::ConfigurationError);

	RegionSet ok("ok", WktFromEpsg(32652));
	ok.add(Region("a", "A", CellRect(0, 0, 1, 1)));
	ok.add(Region("b", "B", CellRect(2, 2, 3, 3)));
	ok.checkIds();
	EXPECT_EQ(ok.size(), (size_t) 2);
}

static void TestReprojectionRoundTrip() {
	std::string utm = WktFromEpsg(32652);
	std::unique_ptr<OGRGeometry> rect = CellRect(10, 10, 59, 39);
	double area = geometryArea(*rect);
	EXPECT_NEAR(area, 50 * 30 * kRes * kRes, 1e-6);

	OGRSpatialReference wgs;
	wgs.importFromEPSG(4326);
	wgs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	OGRSpatialReference dst;
	dst.importFromEPSG(32652);
	dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

	std::unique_ptr<OGRGeometry> geo = reproject(*rect, utm, wgs);
	std::unique_ptr<OGRGeometry> back = reproject(*geo, WktFromEpsg(4326), dst);
	EXPECT_NEAR(geometryArea(*back), area, area * 1e-6);
	EXPECT_EQ(geometryArea(*back), geometryArea(*back));

	OGREnvelope env;
	geo->getEnvelope(&env);
	EXPECT_TRUE(env.MinX > 128.0 && env.MaxX < 130.0);
	EXPECT_TRUE(env.MinY > 35.0 && env.MaxY < 37.0);

	EXPECT_THROW(reproject(*rect, "", wgs), sarflood::ConfigurationError);
}

static void TestInvalidGeometry() {
	std::unique_ptr<OGRGeometry> bowtie = FromWkt("POLYGON ((0 0, 10 10, 10 0, 0 10, 0 0))");
	ASSERT_TRUE(bowtie != nullptr);
	EXPECT_FALSE(bowtie->IsValid());

	EXPECT_THROW(checkGeometry(std::unique_ptr<OGRGeometry>(bowtie->clone()), false, "bowtie"),
			sarflood::InvalidGeometryError);

	bool repaired = false;
	std::unique_ptr<OGRGeometry> fixed = checkGeometry(std::unique_ptr<OGRGeometry>(bowtie->clone()), true,
			"bowtie", &repaired);
	ASSERT_TRUE(fixed != nullptr);
	EXPECT_TRUE(repaired);
	EXPECT_TRUE(fixed->IsValid());
	EXPECT_NEAR(geometryArea(*fixed), 50.0, 1e-6);

	std::unique_ptr<OGRGeometry> square = FromWkt("POLYGON ((0 0, 1 0, 1 1, 0 1, 0 0))");
	checkGeometry(std::move(square), false, "square", &repaired);
	EXPECT_FALSE(repaired);
}

static void TestParallelMatchesSequential() {
	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);

	RegionSet regions("quadrants", WktFromEpsg(32652));
	regions.add(Region("nw", "NW", CellRect(0, 0, 44, 44)));
	regions.add(Region("ne", "NE", CellRect(45, 0, 99, 44)));
	regions.add(Region("sw", "SW", CellRect(0, 45, 44, 99)));
	regions.add(Region("se", "SE", CellRect(45, 45, 99, 99)));
	regions.add(Region("mid", "Middle", CellRect(42, 42, 47, 47)));

	RegionSet none;
	Config config;
	FloodResult seq = Flood(config, nullptr).process(ref, flood, none, none, regions);
	config.threads = 3;
	FloodResult par = Flood(config, nullptr).process(ref, flood, none, none, regions);

	ASSERT_TRUE(seq.stats.size() == par.stats.size());
	ASSERT_TRUE(seq.stats.size() == 6);
	for(size_t i = 0; i < seq.stats.size(); ++i) {
		EXPECT_EQ(seq.stats[i].regionId, par.stats[i].regionId);
		EXPECT_NEAR(seq.stats[i].floodedArea, par.stats[i].floodedArea, 1e-9);
		EXPECT_NEAR(seq.stats[i].regionArea, par.stats[i].regionArea, 1e-9);
	}
	for(size_t i = 0; i < 4; ++i)
		EXPECT_NEAR(seq.stats[i].floodedArea, 2500.0, 1e-6);
	EXPECT_NEAR(seq.stats[4].floodedArea, 3600.0, 1e-6);
}

static void TestConfig() {
	Config config;
	EXPECT_TRUE(config.thresholdMode == ThresholdMode::Fixed);
	EXPECT_EQ(config.fixedThresholdDb, 3.0);
	EXPECT_EQ(config.histogramBins, 256);
	EXPECT_EQ(config.regionIdField, std::string("id"));
	EXPECT_EQ(config.outputCrs, std::string("auto"));
	EXPECT_TRUE(config.repairGeometry);
	config.validate();

	config.set("threshold_mode", "automatic");
	config.set("Fixed_Threshold_dB", " 2.5 ");
	config.set("band_combination_policy", "weighted");
	config.set("band_weights", "1, 0.5");
	config.set("write_change", "yes");
	config.set("log_level", "debug");
	EXPECT_TRUE(config.thresholdMode == ThresholdMode::Automatic);
	EXPECT_EQ(config.fixedThresholdDb, 2.5);
	EXPECT_TRUE(config.bandPolicy == BandPolicy::Weighted);
	ASSERT_TRUE(config.bandWeights.size() == 2);
	EXPECT_EQ(config.bandWeights[1], 0.5);
	EXPECT_TRUE(config.writeChange);
	EXPECT_EQ(config.logLevel, SF_LOG_DEBUG);
	config.validate();

	EXPECT_THROW(config.set("no_such_key", "1"), sarflood::ConfigurationError);
	EXPECT_THROW(config.set("histogram_bins", "many"), sarflood::ConfigurationError);
	EXPECT_THROW(config.set("threshold_mode", "median"), sarflood::ConfigurationError);
	EXPECT_THROW(config.set("repair_geometry", "maybe"), sarflood::ConfigurationError);
	EXPECT_THROW(config.set("min_region_size_px", "4294967396"), sarflood::ConfigurationError);
	EXPECT_THROW(config.set("hole_fill_size_px", "-4294967396"), sarflood::ConfigurationError);
	EXPECT_THROW(config.set("threads", "99999999999999999999999"), sarflood::ConfigurationError);

	Config bins;
	bins.histogramBins = 1;
	EXPECT_THROW(bins.validate(), sarflood::ConfigurationError);
	bins.set("histogram_bins", "2000000000");
	EXPECT_EQ(bins.histogramBins, 2000000000);
	EXPECT_THROW(bins.validate(), sarflood::ConfigurationError);
	bins.histogramBins = MAX_HISTOGRAM_BINS;
	bins.validate();
	Config negative;
	negative.minRegionSizePx = -1;
	EXPECT_THROW(negative.validate(), sarflood::ConfigurationError);
	Config holes;
	holes.holeFillSizePx = -4;
	EXPECT_THROW(holes.validate(), sarflood::ConfigurationError);
	Config weights;
	weights.bandPolicy = BandPolicy::Weighted;
	EXPECT_THROW(weights.validate(), sarflood::ConfigurationError);
	Config crs;
	crs.outputCrs = "EPSG:4326";
	EXPECT_THROW(crs.validate(), sarflood::ConfigurationError);
	Config threads;
	threads.threads = 0;
	EXPECT_THROW(threads.validate(), sarflood::ConfigurationError);
	Config buffer;
	buffer.aoiBufferM = -10;
	EXPECT_THROW(buffer.validate(), sarflood::ConfigurationError);
}

static void TestConfigFile() {
	std::string dir = MakeTempDir();
	ASSERT_TRUE(!dir.empty());
	std::string file = sarflood::util::join(dir, "run.yaml");
	{
		std::ofstream out(file);
		out << "# A run\n"
				<< "reference: /data/ref.tif\n"
				<< "flood: /data/flood.tif   # event\n"
				<< "\n"
				<< "min_region_size_px: 12\n"
				<< "output_crs: EPSG:32652\n"
				<< "band_combination_policy: weighted\n"
				<< "band_weights: [1, 0.5]\n"
				<< "write_change: true\n"
				<< "region_area_field:\n";
	}
	Config config;
	config.load(file);
	EXPECT_EQ(config.reference, std::string("/data/ref.tif"));
	EXPECT_EQ(config.flood, std::string("/data/flood.tif"));
	EXPECT_EQ(config.minRegionSizePx, 12);
	EXPECT_EQ(config.outputCrs, std::string("EPSG:32652"));
	EXPECT_TRUE(config.bandPolicy == BandPolicy::Weighted);
	ASSERT_TRUE(config.bandWeights.size() == 2);
	EXPECT_EQ(config.bandWeights[0], 1.0);
	EXPECT_EQ(config.bandWeights[1], 0.5);
	EXPECT_TRUE(config.writeChange);
	EXPECT_TRUE(config.regionAreaField.empty());
	config.validate();

	// Each bad document is rejected as a configuration error.
	const char* bad[] = {
		"threads: 2\nthis line has no separator\n",
		"threads: [2\n",
		"no_such_key: 1\n",
		"histogram_bins: many\n",
		"threads:\n  count: 2\n",
		"- reference\n- flood\n"
	};
	std::string badFile = sarflood::util::join(dir, "bad.yaml");
	for(const char* doc : bad) {
		{
			std::ofstream out(badFile);
			out << doc;
		}
		Config other;
		EXPECT_THROW(other.load(badFile), sarflood::ConfigurationError);
	}

	// An empty document changes nothing.
	{
		std::ofstream out(badFile);
		out << "# nothing\n";
	}
	Config empty;
	empty.load(badFile);
	EXPECT_EQ(empty.histogramBins, 256);

	Config missing;
	EXPECT_THROW(missing.load(sarflood::util::join(dir, "missing.yaml")), sarflood::ConfigurationError);

	sarflood::util::rem(file);
	sarflood::util::rem(badFile);
	rmdir(dir.c_str());
}

static void TestFileOutput() {
	std::string dir = MakeTempDir();
	ASSERT_TRUE(!dir.empty());

	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);
	std::string refFile = sarflood::util::join(dir, "ref.tif");
	std::string floodFile = sarflood::util::join(dir, "flood.tif");
	ref.band(1).write(refFile);
	flood.band(1).write(floodFile);

	// A regions file with no CRS is read as WGS84.
	std::string regionsFile = sarflood::util::join(dir, "regions.geojson");
	{
		std::ofstream out(regionsFile);
		out << "{\"type\": \"FeatureCollection\", \"features\": ["
				<< "{\"type\": \"Feature\", \"properties\": {\"id\": \"r1\", \"name\": \"Region, one\"},"
				<< " \"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[[128.9, 35.9], [129.1, 35.9], [129.1, 36.2], [128.9, 36.2], [128.9, 35.9]]]}}"
				<< "]}";
	}

	RegionSet loaded = RegionSet::load(regionsFile, "id", "name", "", true);
	ASSERT_TRUE(loaded.size() == 1);
	EXPECT_EQ(loaded.region(0).id(), std::string("r1"));
	EXPECT_EQ(loaded.region(0).name(), std::string("Region, one"));
	EXPECT_FALSE(loaded.region(0).hasArea());
	EXPECT_THROW(RegionSet::load(regionsFile, "code", "", "", true), sarflood::ConfigurationError);

	std::string outDir = sarflood::util::join(dir, "out");
	Config config;
	config.reference = refFile;
	config.flood = floodFile;
	config.regions = regionsFile;
	config.outputDir = outDir;
	config.writeChange = true;

	FloodFileOutput output;
	output.dir = outDir;
	output.writeChange = true;
	FloodResult result = Flood(config, &output).flood();
	EXPECT_EQ(result.floodedPixels, (size_t) 100);
	ASSERT_TRUE(result.stats.size() == 2);
	EXPECT_NEAR(result.stats[0].floodedArea, 10000.0, 1e-3);

	const char* files[] = {"flood_mask.tif", "change_map.tif", "flood_areas.geojson", "flood_stats.geojson", "flood_stats.csv"};
	for(const char* f : files) {
		std::string path = sarflood::util::join(outDir, f);
		EXPECT_TRUE(sarflood::util::isfile(path));
		EXPECT_FALSE(sarflood::util::isfile(path + ".tmp"));
	}

	DatasetPtr ds = openRaster(sarflood::util::join(outDir, "flood_mask.tif"));
	Band<uint8_t> mask;
	mask.read(ds.get(), 1);
	ds.reset();
	EXPECT_EQ(mask.count(MASK_FLOODED), (size_t) 100);
	EXPECT_TRUE(mask.props().nodataSet());
	EXPECT_EQ(mask.props().nodata(), 255.0);

	std::ifstream csv(sarflood::util::join(outDir, "flood_stats.csv"));
	std::string header;
	std::string row;
	std::getline(csv, header);
	std::getline(csv, row);
	EXPECT_EQ(header.substr(0, 15), std::string("region_id,name,"));
	EXPECT_EQ(row.substr(0, 17), std::string("r1,\"Region, one\","));

	// Missing inputs fail before anything is written.
	std::string otherDir = sarflood::util::join(dir, "other");
	Config missing = config;
	missing.reference = sarflood::util::join(dir, "nope.tif");
	FloodFileOutput otherOut;
	otherOut.dir = otherDir;
	EXPECT_THROW(Flood(missing, &otherOut).flood(), sarflood::ConfigurationError);
	EXPECT_FALSE(sarflood::util::isdir(otherDir));

	// Duplicate region IDs are rejected before the rasters are read.
	std::string dupFile = sarflood::util::join(dir, "dup.geojson");
	{
		std::ofstream out(dupFile);
		out << "{\"type\": \"FeatureCollection\", \"features\": ["
				<< "{\"type\": \"Feature\", \"properties\": {\"id\": \"x\"}, \"geometry\": {\"type\": \"Point\", \"coordinates\": [129, 36]}},"
				<< "{\"type\": \"Feature\", \"properties\": {\"id\": \"x\"}, \"geometry\": {\"type\": \"Point\", \"coordinates\": [129, 36]}}"
				<< "]}";
	}
	Config dup = config;
	dup.regions = dupFile;
	DummyFloodOutput dummy;
	EXPECT_THROW(Flood(dup, &dummy).flood(), sarflood::ConfigurationError);
}

static void TestNonFiniteIsNoData() {
	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);
	Band<float> r = ref.band(1);
	Band<float> f = flood.band(1);
	f.set(5, 5, -std::numeric_limits<float>::infinity());
	r.set(90, 90, std::numeric_limits<float>::infinity());
	Scene refInf = MakeScene("ref", r);
	Scene floodInf = MakeScene("flood", f);

	EXPECT_TRUE(f.isNoData(-std::numeric_limits<float>::infinity()));
	EXPECT_FALSE(f.isNoData(-5.0f));

	Band<float> change = computeChange(refInf, floodInf, BandPolicy::Single);
	EXPECT_EQ(change.get(5, 5), CHANGE_NODATA);
	EXPECT_EQ(change.get(90, 90), CHANGE_NODATA);
	Band<uint8_t> mask = classify(change, 3.0);
	EXPECT_EQ(mask.get(5, 5), MASK_UNKNOWN);
	EXPECT_EQ(mask.get(90, 90), MASK_UNKNOWN);

	RegionSet none;
	Config config;
	FloodResult fixed = Flood(config, nullptr).process(refInf, floodInf, none, none, none);
	EXPECT_EQ(fixed.floodedPixels, (size_t) 100);
	EXPECT_EQ(fixed.validPixels, (size_t) 9998);

	config.thresholdMode = ThresholdMode::Automatic;
	FloodResult automatic = Flood(config, nullptr).process(refInf, floodInf, none, none, none);
	EXPECT_TRUE(std::isfinite(automatic.threshold));
	EXPECT_TRUE(automatic.threshold > 0 && automatic.threshold < 5);
	EXPECT_EQ(automatic.floodedPixels, (size_t) 100);
	EXPECT_EQ(automatic.validPixels, (size_t) 9998);
}

static void TestVectorizeDiagonal() {
	// Two cells meeting at one corner are one 8-connected polygon.
	Band<uint8_t> mask = MakeMask(6, 6, MASK_DRY);
	mask.set(2, 2, MASK_FLOODED);
	mask.set(3, 3, MASK_FLOODED);

	std::vector<FloodPolygon> polys = vectorize(mask, true);
	ASSERT_TRUE(polys.size() == 1);
	EXPECT_NEAR(polys[0].area(), 2 * kRes * kRes, 1e-6);
	EXPECT_TRUE(polys[0].geometry().IsValid());

	// Without repair the same polygon is either valid as traced or rejected outright.
	bool threw = false;
	try {
		std::vector<FloodPolygon> raw = vectorize(mask, false);
		ASSERT_TRUE(raw.size() == 1);
		EXPECT_NEAR(raw[0].area(), 2 * kRes * kRes, 1e-6);
		EXPECT_FALSE(raw[0].repaired());
	} catch(const sarflood::InvalidGeometryError&) {
		threw = true;
	}
	EXPECT_EQ(threw, polys[0].repaired());
}

static void TestVectorizeWithUnknownCells() {
	// Unknown cells inside a flooded grid are holes, not flooded area.
	Band<uint8_t> mask = MakeMask(10, 10, MASK_FLOODED);
	mask.set(2, 2, MASK_UNKNOWN);
	mask.set(5, 5, MASK_UNKNOWN);
	mask.set(7, 3, MASK_UNKNOWN);
	mask.set(0, 9, MASK_UNKNOWN);

	std::vector<FloodPolygon> polys = vectorize(mask);
	ASSERT_TRUE(polys.size() == 1);
	EXPECT_NEAR(polys[0].area(), mask.count(MASK_FLOODED) * kRes * kRes, 1e-6);
	EXPECT_NEAR(polys[0].area(), 96 * kRes * kRes, 1e-6);
}

static void TestRegionWithoutGeometry() {
	std::string dir = MakeTempDir();
	ASSERT_TRUE(!dir.empty());

	Region bare("n", "N", nullptr);
	EXPECT_TRUE(bare.geometry().IsEmpty());

	std::string file = sarflood::util::join(dir, "regions.geojson");
	{
		std::ofstream out(file);
		out << "{\"type\": \"FeatureCollection\", \"features\": ["
				<< "{\"type\": \"Feature\", \"properties\": {\"id\": \"a\", \"area\": 5000}, \"geometry\": null},"
				<< "{\"type\": \"Feature\", \"properties\": {\"id\": \"b\"},"
				<< " \"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[[128.9, 35.9], [129.1, 35.9], [129.1, 36.2], [128.9, 36.2], [128.9, 35.9]]]}}"
				<< "]}";
	}

	RegionSet loaded = RegionSet::load(file, "id", "", "", true);
	ASSERT_TRUE(loaded.size() == 2);
	EXPECT_EQ(loaded.region(0).id(), std::string("a"));
	EXPECT_TRUE(loaded.region(0).geometry().IsEmpty());
	loaded.checkIds();

	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);
	RegionSet none;
	Config config;
	FloodResult result = Flood(config, nullptr).process(ref, flood, none, none, loaded);
	ASSERT_TRUE(result.stats.size() == 3);
	EXPECT_EQ(result.stats[0].regionId, std::string("a"));
	EXPECT_EQ(result.stats[0].floodedArea, 0.0);
	EXPECT_EQ(result.stats[0].regionArea, 0.0);
	EXPECT_TRUE(std::isnan(result.stats[0].floodedFraction));
	EXPECT_NEAR(result.stats[1].floodedArea, 10000.0, 1e-3);
	EXPECT_NEAR(result.stats[2].floodedArea, 10000.0, 1e-3);

	// A supplied area gives the empty region a defined fraction.
	RegionSet withArea = RegionSet::load(file, "id", "", "area", true);
	FloodResult areaResult = Flood(config, nullptr).process(ref, flood, none, none, withArea);
	ASSERT_TRUE(areaResult.stats.size() == 3);
	EXPECT_EQ(areaResult.stats[0].regionArea, 5000.0);
	EXPECT_EQ(areaResult.stats[0].floodedFraction, 0.0);

	// A region without geometry still takes part in the ID checks.
	std::string dupFile = sarflood::util::join(dir, "dup.geojson");
	{
		std::ofstream out(dupFile);
		out << "{\"type\": \"FeatureCollection\", \"features\": ["
				<< "{\"type\": \"Feature\", \"properties\": {\"id\": \"b\"}, \"geometry\": null},"
				<< "{\"type\": \"Feature\", \"properties\": {\"id\": \"b\"},"
				<< " \"geometry\": {\"type\": \"Polygon\", \"coordinates\": [[[128.9, 35.9], [129.1, 35.9], [129.1, 36.2], [128.9, 36.2], [128.9, 35.9]]]}}"
				<< "]}";
	}
	RegionSet dup = RegionSet::load(dupFile, "id", "", "", true);
	EXPECT_EQ(dup.size(), (size_t) 2);
	EXPECT_THROW(dup.checkIds(), sarflood::ConfigurationError);

	sarflood::util::rem(file);
	sarflood::util::rem(dupFile);
	rmdir(dir.c_str());
}

static void TestFailedSaveKeepsPreviousOutput() {
	std::string dir = MakeTempDir();
	ASSERT_TRUE(!dir.empty());

	Scene ref;
	Scene flood;
	MakeBlockScenes(&ref, &flood);
	RegionSet none;

	FloodFileOutput output;
	output.dir = dir;
	Config config;
	FloodResult first = Flood(config, nullptr).process(ref, flood, none, none, CoveringRegion());
	output.save(first);

	// Saving again replaces the set and leaves nothing staged behind.
	output.save(first);
	const char* files[] = {"flood_mask.tif", "flood_areas.geojson", "flood_stats.geojson", "flood_stats.csv"};
	for(const char* f : files) {
		std::string path = sarflood::util::join(dir, f);
		EXPECT_TRUE(sarflood::util::isfile(path));
		EXPECT_FALSE(sarflood::util::isfile(path + ".tmp"));
		EXPECT_FALSE(sarflood::util::isfile(path + ".bak"));
	}

	// A directory in the way of the last file's backup makes the second save fail part way.
	std::string blocker = sarflood::util::join(dir, "flood_stats.csv.bak");
	ASSERT_TRUE(sarflood::util::makedir(blocker));
	config.minRegionSizePx = 101;
	FloodResult second = Flood(config, nullptr).process(ref, flood, none, none, CoveringRegion());
	EXPECT_EQ(second.floodedPixels, (size_t) 0);
	EXPECT_THROW(output.save(second), std::runtime_error);

	// The first set is intact.
	for(const char* f : files) {
		std::string path = sarflood::util::join(dir, f);
		EXPECT_TRUE(sarflood::util::isfile(path));
		EXPECT_FALSE(sarflood::util::isfile(path + ".tmp"));
		EXPECT_FALSE(sarflood::util::isfile(path + ".bak"));
	}
	DatasetPtr ds = openRaster(sarflood::util::join(dir, "flood_mask.tif"));
	Band<uint8_t> mask;
	mask.read(ds.get(), 1);
	ds.reset();
	EXPECT_EQ(mask.count(MASK_FLOODED), (size_t) 100);

	rmdir(blocker.c_str());
	for(const char* f : files)
		sarflood::util::rem(sarflood::util::join(dir, f));
	rmdir(dir.c_str());
}

int main() {
	GDALAllRegister();
	sarflood::loglevel(SF_LOG_WARN);

	TestEqualScenesAreNotFlooded();
	TestNoDataPropagates();
	TestBandPolicies();
	TestGridMismatch();
	TestEmptyInput();
	TestOtsu();
	TestCleanRemovesSmallRegions();
	TestCleanFillsHoles();
	TestCleanIsIdempotent();
	TestVectorizeEmptyAndFull();
	TestVectorizeDiagonal();
	TestVectorizeWithUnknownCells();
	TestNonFiniteIsNoData();
	TestEndToEndBlock();
	TestEndToEndBlockRemoved();
	TestAutomaticCrs();
	TestRegionPartition();
	TestUrbanClip();
	TestZeroAreaRegion();
	TestRegionIds();
	TestRegionWithoutGeometry();
	TestReprojectionRoundTrip();
	TestInvalidGeometry();
	TestParallelMatchesSequential();
	TestConfig();
	TestConfigFile();
	TestFileOutput();
	TestFailedSaveKeepsPreviousOutput();

	if(g_failures == 0) {
		std::cout << "sarflood_tests: OK\n";
		return 0;
	}

	std::cerr << "sarflood_tests: FAILED (" << g_failures << ")\n";
	return 1;
}
