/*
 * util.cpp
 *
 *  Created on: Oct 6, 2026
 *      Author: rob
 */

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <iomanip>

#include <ogrsf_frmts.h>
#include <yaml-cpp/yaml.h>

#include "flood.hpp"

using namespace sarflood::flood;
using namespace sarflood::flood::util;

namespace {

	int parseInt(const std::string& key, const std::string& value) {
		const char* str = value.c_str();
		char* end = nullptr;
		errno = 0;
		long v = std::strtol(str, &end, 10);
		if(value.empty() || *end != '\0')
			sf_err(sarflood::ConfigurationError, "The value of " << key << " must be an integer; got '" << value << "'.");
		if(errno == ERANGE || v < INT_MIN || v > INT_MAX)
			sf_err(sarflood::ConfigurationError, "The value of " << key << " is out of range; got '" << value << "'.");
		return (int) v;
	}

	double parseDouble(const std::string& key, const std::string& value) {
		const char* str = value.c_str();
		char* end = nullptr;
		double v = std::strtod(str, &end);
		if(value.empty() || *end != '\0')
			sf_err(sarflood::ConfigurationError, "The value of " << key << " must be a number; got '" << value << "'.");
		return v;
	}

	bool parseBool(const std::string& key, const std::string& value) {
		std::string v = sarflood::util::lowercase(value);
		if(v == "true" || v == "t" || v == "yes" || v == "1")
			return true;
		if(v == "false" || v == "f" || v == "no" || v == "0")
			return false;
		sf_err(sarflood::ConfigurationError, "The value of " << key << " must be true or false; got '" << value << "'.");
	}

	int parseLogLevel(const std::string& value) {
		std::string v = sarflood::util::lowercase(value);
		if(v == "debug") return SF_LOG_DEBUG;
		if(v == "info") return SF_LOG_INFO;
		if(v == "warn" || v == "warning") return SF_LOG_WARN;
		if(v == "error") return SF_LOG_ERROR;
		sf_err(sarflood::ConfigurationError, "Unknown log level '" << value << "'.");
	}

	/**
	 * \brief Quote a CSV field if it contains a delimiter, quote or line break.
	 */
	std::string csvField(const std::string& value) {
		if(value.find_first_of(",\"\r\n") == std::string::npos)
			return value;
		std::string out = "\"";
		for(char c : value) {
			if(c == '"')
				out += '"';
			out += c;
		}
		out += '"';
		return out;
	}

	/**
	 * \brief A GeoJSON file under construction in EPSG:4326.
	 */
	/**
	 * \brief Move each staged file onto its target as one set.
	 *
	 * Existing targets are first moved aside to a .bak name. If any move fails, the files
	 * already committed are removed and the previous set is restored before rethrowing.
	 */
	void commit(const std::vector<std::string>& staged, const std::vector<std::string>& targets) {
		std::vector<std::string> backedUp;
		std::vector<std::string> committed;
		try {
			for(const std::string& path : targets) {
				if(!sarflood::util::isfile(path))
					continue;
				std::string bak = path + ".bak";
				sarflood::util::rem(bak);
				if(0 != std::rename(path.c_str(), bak.c_str()))
					sf_runerr("Failed to move " << path << " aside.");
				backedUp.push_back(path);
			}
			for(size_t i = 0; i < targets.size(); ++i) {
				if(0 != std::rename(staged[i].c_str(), targets[i].c_str()))
					sf_runerr("Failed to move " << staged[i] << " to " << targets[i] << ".");
				committed.push_back(targets[i]);
			}
		} catch(const std::exception&) {
			for(const std::string& path : committed)
				sarflood::util::rem(path);
			for(const std::string& path : backedUp) {
				std::string bak = path + ".bak";
				if(0 != std::rename(bak.c_str(), path.c_str()))
					sf_error("Failed to restore " << path << " from " << bak << ".");
			}
			throw;
		}
		for(const std::string& path : backedUp)
			sarflood::util::rem(path + ".bak");
	}

	class GeoJSONWriter {
	private:
		DatasetPtr m_ds;
		OGRLayer* m_lyr;
		OGRSpatialReference m_wgs;

	public:

		GeoJSONWriter(const std::string& filename, const std::string& layer) :
			m_lyr(nullptr) {
			GDALDriver* drv = GetGDALDriverManager()->GetDriverByName("GeoJSON");
			if(!drv)
				sf_runerr("The GeoJSON driver is not available.");
			m_ds.reset(drv->Create(filename.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
			if(!m_ds)
				sf_runerr("Failed to create " << filename << ".");
			m_wgs.SetWellKnownGeogCS("WGS84");
			m_wgs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
			m_lyr = m_ds->CreateLayer(layer.c_str(), &m_wgs, wkbMultiPolygon, nullptr);
			if(!m_lyr)
				sf_runerr("Failed to create layer " << layer << " in " << filename << ".");
		}

		void addField(const std::string& name, OGRFieldType type) {
			OGRFieldDefn field(name.c_str(), type);
			if(OGRERR_NONE != m_lyr->CreateField(&field))
				sf_runerr("Failed to create field " << name << ".");
		}

		OGRFeatureDefn* defn() const {
			return m_lyr->GetLayerDefn();
		}

		void add(OGRFeature& feat, const OGRGeometry& geom, const std::string& wkt) {
			std::unique_ptr<OGRGeometry> g = reproject(geom, wkt, m_wgs);
			if(OGRERR_NONE != feat.SetGeometryDirectly(g.release()))
				sf_runerr("Failed to set feature geometry.");
			if(OGRERR_NONE != m_lyr->CreateFeature(&feat))
				sf_runerr("Failed to write feature.");
		}

		void close() {
			m_ds.reset();
		}
	};

} // anon


Config::Config() :
	aoiBufferM(0),
	regionIdField("id"),
	regionNameField("name"),
	thresholdMode(ThresholdMode::Fixed),
	fixedThresholdDb(3.0),
	histogramBins(256),
	minRegionSizePx(0),
	holeFillSizePx(0),
	bandPolicy(BandPolicy::Single),
	band(1),
	outputCrs("auto"),
	repairGeometry(true),
	threads(1),
	writeChange(false),
	logLevel(SF_LOG_INFO) {
}

void Config::set(const std::string& name, const std::string& val) {
	std::string key = sarflood::util::lowercase(sarflood::util::trim(name));
	std::string value = sarflood::util::trim(val);
	if(key == "reference") {
		reference = value;
	} else if(key == "flood") {
		flood = value;
	} else if(key == "urban") {
		urban = value;
	} else if(key == "aoi") {
		aoi = value;
	} else if(key == "aoi_buffer_m") {
		aoiBufferM = parseDouble(key, value);
	} else if(key == "regions") {
		regions = value;
	} else if(key == "region_id_field") {
		regionIdField = value;
	} else if(key == "region_name_field") {
		regionNameField = value;
	} else if(key == "region_area_field") {
		regionAreaField = value;
	} else if(key == "output_dir") {
		outputDir = value;
	} else if(key == "threshold_mode") {
		thresholdMode = parseThresholdMode(value);
	} else if(key == "fixed_threshold_db") {
		fixedThresholdDb = parseDouble(key, value);
	} else if(key == "histogram_bins") {
		histogramBins = parseInt(key, value);
	} else if(key == "min_region_size_px") {
		minRegionSizePx = parseInt(key, value);
	} else if(key == "hole_fill_size_px") {
		holeFillSizePx = parseInt(key, value);
	} else if(key == "band_combination_policy") {
		bandPolicy = parseBandPolicy(value);
	} else if(key == "band") {
		band = parseInt(key, value);
	} else if(key == "band_weights") {
		std::vector<std::string> parts;
		sarflood::util::split(std::back_inserter(parts), value);
		bandWeights.clear();
		for(const std::string& p : parts)
			bandWeights.push_back(parseDouble(key, p));
	} else if(key == "output_crs") {
		outputCrs = value;
	} else if(key == "repair_geometry") {
		repairGeometry = parseBool(key, value);
	} else if(key == "threads") {
		threads = parseInt(key, value);
	} else if(key == "write_change") {
		writeChange = parseBool(key, value);
	} else if(key == "log_level") {
		logLevel = parseLogLevel(value);
	} else {
		sf_err(ConfigurationError, "Unknown configuration key '" << name << "'.");
	}
}

void Config::load(const std::string& filename) {
	YAML::Node root;
	try {
		root = YAML::LoadFile(filename);
	} catch(const YAML::BadFile&) {
		sf_err(ConfigurationError, "Failed to open configuration file " << filename << ".");
	} catch(const YAML::Exception& ex) {
		sf_err(ConfigurationError, filename << ": " << ex.what());
	}
	if(root.IsNull())
		return;
	if(!root.IsMap())
		sf_err(ConfigurationError, filename << ": the configuration must be a mapping of keys to values.");
	for(YAML::const_iterator it = root.begin(); it != root.end(); ++it) {
		int lineNo = it->first.Mark().line + 1;
		try {
			std::string key = it->first.as<std::string>();
			YAML::Node node = it->second;
			std::string value;
			if(node.IsSequence()) {
				// Lists (band_weights) are passed on in their comma-separated form.
				std::stringstream ss;
				for(size_t i = 0; i < node.size(); ++i) {
					if(!node[i].IsScalar())
						sf_err(ConfigurationError, "The value of " << key << " must be a list of scalars.");
					if(i > 0)
						ss << ",";
					ss << node[i].as<std::string>();
				}
				value = ss.str();
			} else if(node.IsScalar()) {
				value = node.as<std::string>();
			} else if(!node.IsNull()) {
				sf_err(ConfigurationError, "The value of " << key << " must be a scalar or a list.");
			}
			set(key, value);
		} catch(const ConfigurationError& ex) {
			sf_err(ConfigurationError, filename << ":" << lineNo << ": " << ex.what());
		} catch(const YAML::Exception& ex) {
			sf_err(ConfigurationError, filename << ":" << lineNo << ": " << ex.what());
		}
	}
}

void Config::validate() const {
	if(!std::isfinite(fixedThresholdDb))
		sf_err(ConfigurationError, "fixed_threshold_db must be finite.");
	if(histogramBins < 2 || histogramBins > MAX_HISTOGRAM_BINS)
		sf_err(ConfigurationError, "histogram_bins must be between 2 and " << MAX_HISTOGRAM_BINS << "; got " << histogramBins << ".");
	if(minRegionSizePx < 0)
		sf_err(ConfigurationError, "min_region_size_px must not be negative; got " << minRegionSizePx << ".");
	if(holeFillSizePx < 0)
		sf_err(ConfigurationError, "hole_fill_size_px must not be negative; got " << holeFillSizePx << ".");
	if(band < 1)
		sf_err(ConfigurationError, "band must be at least 1; got " << band << ".");
	if(bandPolicy == BandPolicy::Weighted) {
		if(bandWeights.empty())
			sf_err(ConfigurationError, "The weighted band policy needs band_weights.");
		for(double w : bandWeights) {
			if(!std::isfinite(w))
				sf_err(ConfigurationError, "band_weights must be finite.");
		}
	}
	if(threads < 1)
		sf_err(ConfigurationError, "threads must be at least 1; got " << threads << ".");
	if(!(aoiBufferM >= 0) || !std::isfinite(aoiBufferM))
		sf_err(ConfigurationError, "aoi_buffer_m must be a non-negative number; got " << aoiBufferM << ".");
	if(!regions.empty() && regionIdField.empty())
		sf_err(ConfigurationError, "region_id_field is required with regions.");
	if(logLevel < SF_LOG_DEBUG || logLevel > SF_LOG_NONE)
		sf_err(ConfigurationError, "Invalid log level " << logLevel << ".");
	if(!outputCrs.empty() && sarflood::util::lowercase(outputCrs) != "auto") {
		OGRSpatialReference sr;
		if(OGRERR_NONE != sr.SetFromUserInput(outputCrs.c_str()))
			sf_err(ConfigurationError, "The output CRS '" << outputCrs << "' is not recognized.");
		if(!sr.IsProjected())
			sf_err(ConfigurationError, "The output CRS '" << outputCrs << "' is not projected; areas need a projected CRS.");
	}
}

ThresholdMode sarflood::flood::parseThresholdMode(const std::string& name) {
	std::string v = sarflood::util::lowercase(name);
	if(v == "fixed")
		return ThresholdMode::Fixed;
	if(v == "automatic" || v == "auto" || v == "otsu")
		return ThresholdMode::Automatic;
	sf_err(ConfigurationError, "Unknown threshold mode '" << name << "'.");
}

std::string sarflood::flood::thresholdModeName(ThresholdMode mode) {
	return mode == ThresholdMode::Fixed ? "fixed" : "automatic";
}

BandPolicy sarflood::flood::parseBandPolicy(const std::string& name) {
	std::string v = sarflood::util::lowercase(name);
	if(v == "single")
		return BandPolicy::Single;
	if(v == "sum")
		return BandPolicy::Sum;
	if(v == "weighted")
		return BandPolicy::Weighted;
	sf_err(ConfigurationError, "Unknown band combination policy '" << name << "'.");
}

std::string sarflood::flood::bandPolicyName(BandPolicy policy) {
	switch(policy) {
	case BandPolicy::Sum: return "sum";
	case BandPolicy::Weighted: return "weighted";
	default: return "single";
	}
}


const std::string FloodFileOutput::MASK_FILE = "flood_mask.tif";
const std::string FloodFileOutput::CHANGE_FILE = "change_map.tif";
const std::string FloodFileOutput::POLYGONS_FILE = "flood_areas.geojson";
const std::string FloodFileOutput::STATS_FILE = "flood_stats.geojson";
const std::string FloodFileOutput::CSV_FILE = "flood_stats.csv";

bool FloodOutput::valid() const {
	return !dir.empty();
}

void FloodOutput::prepare() {
	if(!dir.empty() && !sarflood::util::isdir(dir))
		sarflood::util::makedir(dir);
	if(!sarflood::util::isdir(dir))
		sf_runerr("Output directory " << dir << " does not exist and could not be created.");
}


bool DummyFloodOutput::valid() const {
	return true;
}

void DummyFloodOutput::prepare() {
	// no-op
}

void DummyFloodOutput::save(const FloodResult&) {
	// no-op
}


FloodFileOutput::FloodFileOutput() :
	writeChange(false) {
}

void FloodFileOutput::save(const FloodResult& result) {

	sf_debug("Saving to " << dir);

	std::vector<std::string> finals;
	finals.push_back(MASK_FILE);
	if(writeChange)
		finals.push_back(CHANGE_FILE);
	finals.push_back(POLYGONS_FILE);
	finals.push_back(STATS_FILE);
	finals.push_back(CSV_FILE);

	// Stage every product, then move them into place.
	std::vector<std::string> staged;
	for(const std::string& f : finals) {
		std::string path = sarflood::util::join(dir, f);
		staged.push_back(path + ".tmp");
		sarflood::util::rem(staged.back());
	}

	const IntersectResult& isect = result.intersection;

	try {
		size_t s = 0;

		result.mask.write(staged[s++], "GTiff");

		if(writeChange)
			result.change.write(staged[s++], "GTiff");

		{
			GeoJSONWriter out(staged[s++], "flood_areas");
			out.addField("polygon_id", OFTInteger);
			out.addField("flooded_area", OFTReal);
			for(const FloodPolygon& p : isect.polygons) {
				OGRFeature feat(out.defn());
				feat.SetField("polygon_id", p.id());
				feat.SetField("flooded_area", p.area());
				out.add(feat, p.geometry(), isect.projection);
			}
			out.close();
		}

		{
			GeoJSONWriter out(staged[s++], "flood_stats");
			out.addField("region_id", OFTString);
			out.addField("name", OFTString);
			out.addField("flooded_area", OFTReal);
			out.addField("flooded_fraction", OFTReal);
			out.addField("region_area", OFTReal);
			for(size_t i = 0; i < result.stats.size(); ++i) {
				const StatRecord& rec = result.stats[i];
				const OGRGeometry* geom = rec.aggregate ? isect.total.get() : isect.regions[i].flood.get();
				OGRFeature feat(out.defn());
				feat.SetField("region_id", rec.regionId.c_str());
				feat.SetField("name", rec.name.c_str());
				feat.SetField("flooded_area", rec.floodedArea);
				if(std::isnan(rec.floodedFraction)) {
					feat.SetFieldNull(feat.GetFieldIndex("flooded_fraction"));
				} else {
					feat.SetField("flooded_fraction", rec.floodedFraction);
				}
				feat.SetField("region_area", rec.regionArea);
				if(!geom)
					sf_runerr("No geometry for statistics record " << rec.regionId << ".");
				out.add(feat, *geom, isect.projection);
			}
			out.close();
		}

		{
			std::ofstream out(staged[s++], std::ios::out);
			if(!out.good())
				sf_runerr("Failed to create " << staged[s - 1] << ".");
			out << "region_id,name,flooded_area_m2,flooded_area_ha,flooded_area_km2,region_area_m2,flooded_fraction,"
					<< "valid_pixels,flooded_pixels,threshold_db" << std::endl;
			out << std::setprecision(12);
			for(const StatRecord& rec : result.stats) {
				out << csvField(rec.regionId) << ',' << csvField(rec.name) << ','
						<< rec.floodedArea << ',' << rec.floodedHa() << ',' << rec.floodedKm2() << ','
						<< rec.regionArea << ',';
				if(!std::isnan(rec.floodedFraction))
					out << rec.floodedFraction;
				out << ',';
				if(rec.aggregate)
					out << rec.validPixels << ',' << rec.floodedPixels << ',' << rec.threshold;
				else
					out << ",,";
				out << std::endl;
			}
			out.close();
			if(out.fail())
				sf_runerr("Failed to write " << staged[s - 1] << ".");
		}

		std::vector<std::string> targets;
		for(const std::string& f : finals)
			targets.push_back(sarflood::util::join(dir, f));
		commit(staged, targets);

	} catch(...) {
		for(const std::string& f : staged)
			sarflood::util::rem(f);
		throw;
	}

	sf_info("Wrote " << finals.size() << " files to " << dir);
}
