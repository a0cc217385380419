/*
 * flood.hpp
 *
 * Urban flood mapping from a pair of SAR backscatter scenes: change detection,
 * thresholding, mask cleaning, vectorization, intersection with urban extent
 * and administrative regions, and area statistics.
 *
 *  Created on: Oct 2, 2026
 *      Author: rob
 */

#ifndef INCLUDE_FLOOD_HPP_
#define INCLUDE_FLOOD_HPP_

#include <vector>
#include <string>
#include <memory>
#include <limits>
#include <cstdint>

#include <ogr_geometry.h>
#include <ogr_spatialref.h>

#include "sarflood.hpp"
#include "grid.hpp"

using namespace sarflood::grid;

namespace sarflood {

	namespace flood {

		const uint8_t MASK_DRY = 0;				///<! Mask value for a valid, not flooded pixel.
		const uint8_t MASK_FLOODED = 1;			///<! Mask value for a flooded pixel.
		const uint8_t MASK_UNKNOWN = 255;		///<! Mask value for a pixel with no valid change value.
		const float CHANGE_NODATA = -9999.0f;	///<! Nodata value of the change raster.
		const char* const TOTAL_REGION_ID = "total";	///<! Region ID of the aggregate statistics record.
		const int MAX_HISTOGRAM_BINS = 65536;	///<! Upper bound on the automatic threshold histogram size.

		/**
		 * \brief How the classification threshold is chosen.
		 */
		enum class ThresholdMode {
			Fixed,		///<! A caller-supplied threshold in dB.
			Automatic	///<! Otsu's method on the change histogram.
		};

		/**
		 * \brief How multiple polarization bands are combined into one change value.
		 */
		enum class BandPolicy {
			Single,		///<! Use one band.
			Sum,		///<! Sum the per-band differences.
			Weighted	///<! Weighted sum of the per-band differences.
		};

		/**
		 * \brief The run configuration.
		 *
		 * Every tunable value of a run lives here. Values are set programmatically, from
		 * a YAML file or from command-line flags, and checked by validate().
		 */
		class Config {
		public:
			std::string reference;				///<! The reference (dry) raster.
			std::string flood;					///<! The flood raster.
			std::string urban;					///<! Urban extent polygons. Optional.
			std::string aoi;					///<! Area of interest features. Optional.
			double aoiBufferM;					///<! Buffer distance applied to the AOI features, in metres.
			std::string regions;				///<! Administrative region polygons. Optional.
			std::string regionIdField;			///<! The region ID attribute.
			std::string regionNameField;		///<! The region name attribute. Optional.
			std::string regionAreaField;		///<! The region total area attribute (m2). Optional.
			std::string outputDir;				///<! The output directory.
			ThresholdMode thresholdMode;		///<! Fixed or automatic threshold.
			double fixedThresholdDb;			///<! The fixed threshold in dB.
			int histogramBins;					///<! Histogram bins for the automatic threshold.
			int minRegionSizePx;				///<! Flooded regions smaller than this are removed. 0 disables.
			int holeFillSizePx;					///<! Enclosed holes up to this size are filled. 0 disables.
			BandPolicy bandPolicy;				///<! The band combination policy.
			int band;							///<! The 1-based band used by the single policy.
			std::vector<double> bandWeights;	///<! One weight per band for the weighted policy.
			std::string outputCrs;				///<! The projected analysis CRS, or "auto".
			bool repairGeometry;				///<! Repair invalid geometries instead of failing.
			int threads;						///<! Worker threads for per-region intersection.
			bool writeChange;					///<! Also write the change raster.
			int logLevel;						///<! One of the SF_LOG_* constants.

			/**
			 * \brief Construct a configuration with the documented defaults.
			 */
			Config();

			/**
			 * \brief Set a value by its configuration key.
			 *
			 * \param key The key, e.g. "threshold_mode".
			 * \param value The value as text.
			 * \throw ConfigurationError If the key is unknown or the value cannot be parsed.
			 */
			void set(const std::string& key, const std::string& value);

			/**
			 * \brief Load settings from a YAML file.
			 *
			 * The document is a mapping of configuration keys to scalars. band_weights may also
			 * be given as a list. Each entry is applied with set().
			 *
			 * \param filename The configuration file.
			 * \throw ConfigurationError If the file cannot be read or contains an invalid entry.
			 */
			void load(const std::string& filename);

			/**
			 * \brief Check that every value is in its domain.
			 *
			 * Does not touch input files.
			 *
			 * \throw ConfigurationError On the first invalid value.
			 */
			void validate() const;

		};

		/**
		 * \brief Parse a threshold mode name ("fixed" or "automatic").
		 */
		ThresholdMode parseThresholdMode(const std::string& name);

		std::string thresholdModeName(ThresholdMode mode);

		/**
		 * \brief Parse a band combination policy name ("single", "sum" or "weighted").
		 */
		BandPolicy parseBandPolicy(const std::string& name);

		std::string bandPolicyName(BandPolicy policy);

		/**
		 * \brief A backscatter scene: one or more float bands sharing a grid.
		 */
		class Scene {
		private:
			std::string m_name;					///<! A name for messages; usually the file name.
			GridProps m_props;					///<! The grid properties of the first band.
			std::vector<Band<float>> m_bands;	///<! The bands.

		public:

			Scene();

			/**
			 * \brief Construct a scene from bands that share a grid.
			 *
			 * \param name A name for messages.
			 * \param bands The bands. Must not be empty.
			 */
			Scene(const std::string& name, const std::vector<Band<float>>& bands);

			/**
			 * \brief Read every band of a raster file.
			 *
			 * \param filename The raster file.
			 * \return The scene.
			 */
			static Scene load(const std::string& filename);

			const std::string& name() const;

			const GridProps& props() const;

			int bandCount() const;

			/**
			 * \brief Return a band by its 1-based index.
			 *
			 * \param band The band index.
			 * \return The band.
			 */
			const Band<float>& band(int band) const;

		};

		/**
		 * \brief Summary statistics of the valid cells of a band.
		 */
		class BandStats {
		public:
			size_t count;	///<! The number of valid cells.
			double min;		///<! The minimum.
			double max;		///<! The maximum.
			double mean;	///<! The mean.

			BandStats();
		};

		BandStats computeStats(const Band<float>& band);

		/**
		 * \brief A flood polygon traced from one connected flooded region.
		 *
		 * The area is computed once, at construction, in the units of the
		 * geometry's CRS.
		 */
		class FloodPolygon {
		private:
			int m_id;								///<! The polygon ID.
			std::unique_ptr<OGRGeometry> m_geom;	///<! The geometry.
			double m_area;							///<! The area of the geometry.
			bool m_repaired;						///<! True if the geometry was repaired.

		public:

			FloodPolygon(int id, std::unique_ptr<OGRGeometry> geom, bool repaired = false);

			int id() const;

			const OGRGeometry& geometry() const;

			double area() const;

			bool repaired() const;

		};

		/**
		 * \brief An urban extent, AOI or administrative boundary feature.
		 */
		class Region {
		private:
			std::string m_id;						///<! The region ID.
			std::string m_name;						///<! The region name.
			std::unique_ptr<OGRGeometry> m_geom;	///<! The boundary in the CRS of its RegionSet.
			double m_area;							///<! The supplied total area (m2), or NaN.

		public:

			/**
			 * \brief Create a region. A null geometry is stored as an empty multipolygon.
			 */
			Region(const std::string& id, const std::string& name, std::unique_ptr<OGRGeometry> geom,
					double area = std::numeric_limits<double>::quiet_NaN());

			const std::string& id() const;

			const std::string& name() const;

			const OGRGeometry& geometry() const;

			/**
			 * \brief Return true if a total area was supplied with the feature.
			 */
			bool hasArea() const;

			double area() const;

		};

		/**
		 * \brief An ordered collection of regions in one CRS.
		 */
		class RegionSet {
		private:
			std::string m_source;				///<! The file the regions came from, for messages.
			std::string m_projection;			///<! The CRS of the geometries as WKT.
			std::vector<Region> m_regions;		///<! The regions, in input order.

		public:

			RegionSet();

			RegionSet(const std::string& source, const std::string& projection);

			/**
			 * \brief Load the polygons of the first layer of a vector file.
			 *
			 * If the ID field is empty or absent and not required, the feature ID is used.
			 * A layer without a CRS is taken to be WGS84.
			 *
			 * \param filename The vector file.
			 * \param idField The ID attribute.
			 * \param nameField The name attribute. Optional.
			 * \param areaField The total area attribute. Optional.
			 * \param requireId If true, a missing ID field is an error.
			 * \return The regions.
			 */
			static RegionSet load(const std::string& filename, const std::string& idField = "",
					const std::string& nameField = "", const std::string& areaField = "",
					bool requireId = false);

			void add(Region&& region);

			/**
			 * \brief Check that IDs are present, unique and not reserved.
			 *
			 * \throw ConfigurationError On a bad ID.
			 */
			void checkIds() const;

			const std::string& source() const;

			const std::string& projection() const;

			size_t size() const;

			bool empty() const;

			const Region& region(size_t idx) const;

		};

		/**
		 * \brief The flooded part of one region.
		 */
		class RegionResult {
		public:
			std::string id;							///<! The region ID.
			std::string name;						///<! The region name.
			std::unique_ptr<OGRGeometry> flood;		///<! The flooded part, in the analysis CRS.
			double floodedArea;						///<! The flooded area (m2).
			double regionArea;						///<! The region's total area (m2).

			RegionResult();
		};

		/**
		 * \brief The output of the intersection step.
		 */
		class IntersectResult {
		public:
			std::string projection;					///<! The analysis CRS as WKT.
			std::vector<FloodPolygon> polygons;		///<! The flood polygons in the analysis CRS.
			std::unique_ptr<OGRGeometry> total;		///<! All flooding within the urban/AOI extent.
			double totalArea;						///<! The area of total (m2).
			double extentArea;						///<! The area of the urban/AOI extent or raster footprint (m2).
			std::vector<RegionResult> regions;		///<! Per-region results, in input order.

			IntersectResult();
		};

		/**
		 * \brief Flooded area statistics for one region or the whole extent.
		 */
		class StatRecord {
		public:
			std::string regionId;		///<! The region ID.
			std::string name;			///<! The region name.
			double floodedArea;			///<! The flooded area (m2).
			double regionArea;			///<! The region area (m2).
			double floodedFraction;		///<! Flooded fraction in [0, 1]; NaN if the region area is zero.
			bool aggregate;				///<! True for the whole-extent record.
			size_t validPixels;			///<! Pixels with a valid change value. Aggregate record only.
			size_t floodedPixels;		///<! Flooded pixels after cleaning. Aggregate record only.
			double threshold;			///<! The threshold in dB. Aggregate record only; otherwise NaN.

			StatRecord(const std::string& regionId, const std::string& name,
					double floodedArea, double regionArea, bool aggregate = false);

			double floodedHa() const;

			double floodedKm2() const;
		};

		/**
		 * \brief Return flooded / total clamped to [0, 1], or NaN if the total is not positive.
		 */
		double floodedFraction(double flooded, double total);

		/**
		 * \brief Raise GridMismatchError if the scenes do not share a grid and band count.
		 *
		 * \param ref The reference scene.
		 * \param flood The flood scene.
		 */
		void checkGrids(const Scene& ref, const Scene& flood);

		/**
		 * \brief Compute the change raster, reference minus flood.
		 *
		 * A pixel is nodata if any band used is nodata in either scene.
		 *
		 * \param ref The reference scene.
		 * \param flood The flood scene.
		 * \param policy The band combination policy.
		 * \param band The 1-based band for the single policy.
		 * \param weights One weight per band for the weighted policy.
		 * \return The change raster, with nodata CHANGE_NODATA.
		 */
		Band<float> computeChange(const Scene& ref, const Scene& flood, BandPolicy policy,
				int band = 1, const std::vector<double>& weights = std::vector<double>());

		/**
		 * \brief Choose a threshold with Otsu's method.
		 *
		 * The valid values are binned into equal-width bins between their minimum
		 * and maximum. The upper edge of the bin that maximizes the between-class
		 * variance is returned; the first of equal maxima wins.
		 *
		 * \param change The change raster.
		 * \param bins The number of histogram bins.
		 * \return The threshold.
		 * \throw EmptyInputError If there are no valid pixels.
		 */
		double otsuThreshold(const Band<float>& change, int bins = 256);

		/**
		 * \brief Return the fixed threshold or compute the automatic one, per the configuration.
		 */
		double selectThreshold(const Band<float>& change, const Config& config);

		/**
		 * \brief Classify the change raster. Flooded iff change > threshold.
		 *
		 * \param change The change raster.
		 * \param threshold The threshold in dB.
		 * \return A mask of MASK_DRY, MASK_FLOODED and MASK_UNKNOWN.
		 * \throw EmptyInputError If there are no valid pixels.
		 */
		Band<uint8_t> classify(const Band<float>& change, double threshold);

		/**
		 * \brief Remove small flooded regions, then fill small enclosed holes.
		 *
		 * Both steps use 8-connectivity. A hole is a not-flooded region that touches
		 * neither the grid edge nor an unknown pixel. Unknown pixels are never changed.
		 *
		 * \param mask The mask.
		 * \param minRegionSize Flooded regions with fewer pixels are removed. 0 disables.
		 * \param holeFillSize Holes with at most this many pixels are filled. 0 disables.
		 * \return The cleaned mask.
		 */
		Band<uint8_t> cleanMask(const Band<uint8_t>& mask, int minRegionSize, int holeFillSize);

		/**
		 * \brief Trace one polygon per 8-connected flooded region.
		 *
		 * \param mask The cleaned mask.
		 * \param repair If true, invalid polygons are repaired; otherwise they raise InvalidGeometryError.
		 * \return The polygons in the mask's CRS.
		 */
		std::vector<FloodPolygon> vectorize(const Band<uint8_t>& mask, bool repair = true);

		/**
		 * \brief Return the geometry if it is valid, or a repaired copy.
		 *
		 * \param geom The geometry.
		 * \param repair If false, an invalid geometry raises InvalidGeometryError.
		 * \param label A description for messages.
		 * \param[out] repaired Set to true if the geometry was repaired. Optional.
		 * \return A valid geometry.
		 */
		std::unique_ptr<OGRGeometry> checkGeometry(std::unique_ptr<OGRGeometry> geom, bool repair,
				const std::string& label, bool* repaired = nullptr);

		/**
		 * \brief Return the area of any geometry, in squared units of its CRS. Non-polygonal parts have zero area.
		 */
		double geometryArea(const OGRGeometry& geom);

		/**
		 * \brief Collect the polygonal parts of a geometry into a multipolygon.
		 */
		std::unique_ptr<OGRMultiPolygon> toMultiPolygon(const OGRGeometry& geom);

		/**
		 * \brief Reproject a copy of the geometry.
		 *
		 * \param geom The geometry.
		 * \param srcWkt The geometry's CRS as WKT.
		 * \param dst The target CRS.
		 * \return The reprojected copy.
		 */
		std::unique_ptr<OGRGeometry> reproject(const OGRGeometry& geom, const std::string& srcWkt,
				const OGRSpatialReference& dst);

		/**
		 * \brief Reprojects flood polygons and boundaries to a projected CRS and
		 * intersects them.
		 */
		class Intersector {
		private:
			OGRSpatialReference m_target;	///<! The analysis CRS.
			bool m_repair;					///<! Repair invalid geometries.
			int m_threads;					///<! The number of worker threads.

		public:

			/**
			 * \brief Construct the intersector.
			 *
			 * \param crs The analysis CRS (EPSG code, WKT, PROJ string) or "auto" for the
			 *            UTM zone at the centre of the grid.
			 * \param props The raster grid.
			 * \param repair Repair invalid geometries.
			 * \param threads The number of worker threads for the per-region step.
			 * \throw ConfigurationError If the CRS is unsupported or not projected.
			 */
			Intersector(const std::string& crs, const GridProps& props, bool repair = true, int threads = 1);

			const OGRSpatialReference& target() const;

			std::string targetWkt() const;

			/**
			 * \brief Reproject the geometry to the analysis CRS.
			 */
			std::unique_ptr<OGRGeometry> project(const OGRGeometry& geom, const std::string& srcWkt) const;

			/**
			 * \brief Return the union of the projected (and optionally buffered) regions, or
			 * null if the set is empty.
			 *
			 * \param regions The regions.
			 * \param buffer The buffer distance in metres.
			 */
			std::unique_ptr<OGRGeometry> extent(const RegionSet& regions, double buffer = 0) const;

			/**
			 * \brief Return the raster footprint in the analysis CRS.
			 */
			std::unique_ptr<OGRGeometry> footprint(const GridProps& props) const;

			/**
			 * \brief Intersect the flood polygons with the extent and each region.
			 *
			 * \param polygons The flood polygons in the raster CRS.
			 * \param props The raster grid.
			 * \param urban The urban extent. May be empty.
			 * \param aoi The area of interest. May be empty.
			 * \param aoiBuffer The AOI buffer distance in metres.
			 * \param regions The administrative regions. May be empty.
			 * \return The intersection result.
			 */
			IntersectResult intersect(const std::vector<FloodPolygon>& polygons, const GridProps& props,
					const RegionSet& urban, const RegionSet& aoi, double aoiBuffer,
					const RegionSet& regions) const;

			/**
			 * \brief Compute the flooded part of one region.
			 *
			 * \param total The clipped flood geometry in the analysis CRS.
			 * \param region The region.
			 * \param projection The region's CRS as WKT.
			 * \return The region result.
			 */
			RegionResult intersectRegion(const OGRGeometry& total, const Region& region,
					const std::string& projection) const;

		};

		/**
		 * \brief Produce one record per region, in order, and a final aggregate record.
		 */
		std::vector<StatRecord> aggregate(const IntersectResult& result);

		/**
		 * \brief Everything a run produces.
		 */
		class FloodResult {
		public:
			GridProps props;						///<! The raster grid.
			Band<float> change;						///<! The change raster.
			Band<uint8_t> mask;						///<! The cleaned mask.
			double threshold;						///<! The threshold used.
			size_t validPixels;						///<! Pixels with a valid change value.
			size_t floodedPixels;					///<! Flooded pixels after cleaning.
			std::vector<FloodPolygon> polygons;		///<! Flood polygons in the raster CRS.
			IntersectResult intersection;			///<! The intersection result.
			std::vector<StatRecord> stats;			///<! The statistics.
			int repairs;							///<! The number of repaired flood polygons.

			FloodResult();
		};

		namespace util {

			/**
			 * \brief An abstract class for saving the products of a run.
			 */
			class FloodOutput {
			public:
				std::string dir;	///<! The output directory.

				/**
				 * \brief Return true if the object is configured correctly.
				 *
				 * \return True if the object is configured correctly.
				 */
				virtual bool valid() const;

				/**
				 * \brief Prepare the object for writing output.
				 */
				virtual void prepare();

				/**
				 * \brief Save the products. Either every product is written or none is.
				 *
				 * \param result The run result.
				 */
				virtual void save(const FloodResult& result) = 0;

				virtual ~FloodOutput() {}
			};

			/**
			 * \brief Output for dry runs. Saving is a no-op.
			 */
			class DummyFloodOutput : public FloodOutput {
			public:

				bool valid() const;

				void prepare();

				void save(const FloodResult& result);

			};

			/**
			 * \brief Writes the mask (and change) GeoTIFFs, polygon and statistics
			 * GeoJSON, and a statistics CSV into the output directory.
			 */
			class FloodFileOutput : public FloodOutput {
			public:
				static const std::string MASK_FILE;
				static const std::string CHANGE_FILE;
				static const std::string POLYGONS_FILE;
				static const std::string STATS_FILE;
				static const std::string CSV_FILE;

				bool writeChange;	///<! Also write the change raster.

				FloodFileOutput();

				void save(const FloodResult& result);

			};

		} // util

		/**
		 * \brief Runs the flood mapping pipeline for one pair of scenes.
		 */
		class Flood {
		private:
			Config m_config;					///<! The configuration.
			util::FloodOutput* m_output;		///<! The output object. Not owned.

		public:

			/**
			 * \brief Create a Flood object.
			 *
			 * \param config The configuration.
			 * \param output The output object. Not owned; must outlive this object.
			 */
			Flood(const Config& config, util::FloodOutput* output);

			const Config& config() const;

			/**
			 * \brief Check the configuration and inputs, throw an exception if any are invalid.
			 */
			void validateInputs();

			/**
			 * \brief Run every stage on loaded inputs. Writes nothing.
			 *
			 * \param ref The reference scene.
			 * \param flood The flood scene.
			 * \param urban The urban extent. May be empty.
			 * \param aoi The area of interest. May be empty.
			 * \param regions The administrative regions. May be empty.
			 * \return The result.
			 */
			FloodResult process(const Scene& ref, const Scene& flood,
					const RegionSet& urban, const RegionSet& aoi, const RegionSet& regions) const;

			/**
			 * \brief Validate, load the inputs, process and save.
			 *
			 * Vector inputs are loaded and checked before any raster is read.
			 *
			 * \return The result.
			 */
			FloodResult flood();

		};

	} // flood

} // sarflood

#endif /* INCLUDE_FLOOD_HPP_ */
