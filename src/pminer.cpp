/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <fmt/format.h>

#include <CLI/CLI.hpp>
#include "packet_miner/PacketMiner.h"

namespace pminer {
	enum class in_type : uint8_t {
		File, StdCIn
	};
	struct CmdArgInfo {
		in_type        inSource;
		std::string   inputPath;
		std::string dialectPath;
		bool         apiResponse;
		bool          tableShape;
		bool   skipMissingTables;
	};
}

void configureArgParser(CLI::App& app, pminer::CmdArgInfo& res);
bool readSource(const pminer::CmdArgInfo& args, std::string& source);
auto loadConfig(const pminer::CmdArgInfo& args) -> packet_miner::DialectConfig;
int printTableShape(const std::string& source);
int printPackets(const std::string& source, const packet_miner::DialectConfig& config);

int main(int argc, char* argv[]) {
	pminer::CmdArgInfo args{ pminer::in_type::StdCIn, {}, {}, false, false, false };
	CLI::App app{ "Extract packet schemas from the protocol wiki page", "pminer" };
	configureArgParser(app, args);

	CLI11_PARSE(app, argc, argv);

	args.inSource = args.inputPath.empty() ? pminer::in_type::StdCIn : pminer::in_type::File;

	try {
		std::string source{};
		if (not readSource(args, source)) {
			std::cerr << fmt::format("Cannot open '{}'\n", args.inputPath);
			return 1;
		}
		if (args.tableShape) {
			return printTableShape(source);
		}
		return printPackets(source, loadConfig(args));
	}
	catch (const packet_miner::Error& e) {
		std::cerr << e.what() << "\n";
		return 2;
	}
}

void configureArgParser(CLI::App& app, pminer::CmdArgInfo& res) {
	app.add_option("-i, --input", res.inputPath, "page source to read, standard input when omitted");
	app.add_option("-d, --dialect", res.dialectPath, "JSON file overriding section names and table headers");
	app.add_flag("--api-json", res.apiResponse, "input is a saved revisions API response rather than raw page source");
	app.add_flag("--table-shape", res.tableShape, "draw the span layout of the first table and exit");
	app.add_flag("--skip-missing-tables", res.skipMissingTables, "record packets without a table as skipped instead of failing");
}

bool readSource(const pminer::CmdArgInfo& args, std::string& source) {
	std::ifstream fileIn{};
	if (args.inSource == pminer::in_type::File) {
		fileIn.open(args.inputPath);
		if (not fileIn) {
			return false;
		}
	}
	std::istream& in = args.inSource == pminer::in_type::File ? static_cast<std::istream&>(fileIn) : std::cin;

	if (args.apiResponse) {
		source = packet_miner::pageSourceFromApiResponse(in);
	}
	else {
		std::ostringstream buffer{};
		buffer << in.rdbuf();
		source = buffer.str();
	}
	return true;
}

auto loadConfig(const pminer::CmdArgInfo& args) -> packet_miner::DialectConfig {
	auto config = packet_miner::DialectConfig::modernWiki();
	if (not args.dialectPath.empty()) {
		std::ifstream dialectIn{ args.dialectPath };
		if (not dialectIn) {
			throw packet_miner::FormatError(fmt::format("Cannot open dialect file '{}'", args.dialectPath));
		}
		config = packet_miner::loadDialectConfig(dialectIn);
	}
	if (args.skipMissingTables) {
		config.skipPacketsWithoutTable = true;
	}
	return config;
}

int printTableShape(const std::string& source) {
	auto pos = source.find("{|");
	if (pos == std::string::npos) {
		std::cerr << "No table in input\n";
		return 2;
	}
	auto parsed = packet_miner::buildGrid(std::string_view{ source }.substr(pos));
	std::cout << fmt::format("{} x {}\n", parsed.table.width(), parsed.table.height());
	std::cout << packet_miner::renderGridShape(parsed.table);
	return 0;
}

int printPackets(const std::string& source, const packet_miner::DialectConfig& config) {
	auto root = packet_miner::splitSections(source);
	packet_miner::SectionWalker walker{ config, std::cerr };
	auto batch = walker.walk(root);

	for (const auto& entry : batch.entries) {
		if (not entry.packet) {
			continue;
		}
		std::cout << fmt::format("# {} / {}\n", entry.state, entry.direction);
		if (not packet_miner::schemaExport(*entry.packet, std::cout)) {
			return 2;
		}
	}
	std::cerr << fmt::format("{} packets, {} skipped\n", batch.entries.size(), batch.skipped());
	return 0;
}
