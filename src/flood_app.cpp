/*****************************************************************************************************
 * This program maps flooding in urban areas from a pair of co-registered SAR backscatter scenes,
 * one acquired before the event and one during it. The backscatter change is thresholded into a
 * flood mask, which is cleaned, traced into polygons, clipped to the urban extent and intersected
 * with administrative regions to report flooded area per region.
 *
 * Settings come from a YAML configuration file, the short flags below, or --key value
 * pairs using the configuration keys. Later arguments override earlier ones.
 *
 * Run the program with no arguments for instructions.
 *****************************************************************************************************/

#include <string>
#include <memory>
#include <iostream>

#include <gdal_priv.h>

#include "sarflood.hpp"
#include "flood.hpp"

void usage() {
	std::cerr << "Usage: sarflood <options>\n"
			<< " -c <file>            A YAML configuration file of key: value entries.\n"
			<< " -r <file>            The reference (pre-event) backscatter raster, in dB.\n"
			<< " -f <file>            The flood (event) backscatter raster, in dB.\n"
			<< " -u <file>            Urban extent polygons. If not given, the whole scene is counted.\n"
			<< " -a <file>            Area of interest features.\n"
			<< " -g <file>            Administrative region polygons.\n"
			<< " -o <dir>             The output directory.\n"
			<< " -t <n>               Number of threads for the per-region step. Default 1.\n"
			<< " -n                   Dry run: process everything but write nothing.\n"
			<< " -v                   Verbose (debug) logging.\n"
			<< " --<key> <value>      Set any configuration key, e.g. --threshold_mode automatic.\n"
			<< "\n"
			<< " Configuration keys:\n"
			<< "   reference, flood, urban, aoi, aoi_buffer_m, regions, region_id_field,\n"
			<< "   region_name_field, region_area_field, output_dir, threshold_mode (fixed|automatic),\n"
			<< "   fixed_threshold_db, histogram_bins, min_region_size_px, hole_fill_size_px,\n"
			<< "   band_combination_policy (single|sum|weighted), band, band_weights, output_crs,\n"
			<< "   repair_geometry, threads, write_change, log_level (debug|info|warn|error)\n";
}

using namespace sarflood::flood;
using namespace sarflood::flood::util;

namespace {

	std::string nextArg(int argc, char** argv, int& i) {
		if(i + 1 >= argc)
			sf_err(sarflood::ConfigurationError, "Missing value for " << argv[i] << ".");
		return argv[++i];
	}

} // anon

int main(int argc, char **argv) {

	if(argc < 2) {
		usage();
		return 1;
	}

	GDALAllRegister();

	Config config;
	bool dryRun = false;
	std::unique_ptr<FloodOutput> output;

	try {

		for (int i = 1; i < argc; ++i) {
			std::string a(argv[i]);
			if (a == "-c") {
				config.load(nextArg(argc, argv, i));
			} else if (a == "-r") {
				config.reference = nextArg(argc, argv, i);
			} else if (a == "-f") {
				config.flood = nextArg(argc, argv, i);
			} else if (a == "-u") {
				config.urban = nextArg(argc, argv, i);
			} else if (a == "-a") {
				config.aoi = nextArg(argc, argv, i);
			} else if (a == "-g") {
				config.regions = nextArg(argc, argv, i);
			} else if (a == "-o") {
				config.outputDir = nextArg(argc, argv, i);
			} else if (a == "-t") {
				config.set("threads", nextArg(argc, argv, i));
			} else if (a == "-n") {
				dryRun = true;
			} else if (a == "-v") {
				config.logLevel = SF_LOG_DEBUG;
			} else if (a.size() > 2 && a.substr(0, 2) == "--") {
				config.set(a.substr(2), nextArg(argc, argv, i));
			} else {
				sf_err(sarflood::ConfigurationError, "Unknown argument " << a << ".");
			}
		}

		sarflood::loglevel(config.logLevel);

		if(dryRun) {
			output.reset(new DummyFloodOutput());
		} else {
			FloodFileOutput* out = new FloodFileOutput();
			output.reset(out);
			out->writeChange = config.writeChange;
		}
		output->dir = config.outputDir;

		Flood flood(config, output.get());
		FloodResult result = flood.flood();

		sf_info("Threshold: " << result.threshold << " dB; flooded pixels: " << result.floodedPixels
				<< "; polygons: " << result.polygons.size());

	} catch (const std::exception &e) {
		std::cerr << e.what() << "\n";
		usage();
		return 1;
	}

	return 0;
}
