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

#include <algorithm>
#include <istream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include "packet_miner/DialectConfig.h"
#include "packet_miner/Errors.h"

namespace {
	bool contains(const std::vector<std::string>& names, const std::string& name) {
		return std::find(names.begin(), names.end(), name) != names.end();
	}
}

packet_miner::DialectConfig packet_miner::DialectConfig::modernWiki() {
	DialectConfig config{};
	config.states = { "Status", "Login", "Handshaking", "Configuration", "Play" };
	config.ignoredSections = { "Definitions", "Packet format", "Navigation" };
	config.directions = { "Clientbound", "Serverbound" };
	config.noFieldsMarker = "''no fields''";
	config.packetIdHeader = "Packet ID";
	config.fieldNameHeader = "Field Name";
	config.fieldTypeHeader = "Field Type";
	config.maxNestingDepth = 32;
	config.skipPacketsWithoutTable = false;
	return config;
}

bool packet_miner::DialectConfig::isState(const std::string& name) const {
	return contains(states, name);
}

bool packet_miner::DialectConfig::isIgnored(const std::string& name) const {
	return contains(ignoredSections, name);
}

bool packet_miner::DialectConfig::isDirection(const std::string& name) const {
	return contains(directions, name);
}

auto packet_miner::loadDialectConfig(std::istream& in) -> DialectConfig {
	nlohmann::json jc{};
	try {
		in >> jc;
	}
	catch (const nlohmann::json::parse_error& e) {
		throw FormatError(fmt::format("Dialect configuration is not valid JSON: {}", e.what()));
	}
	if (not jc.is_object()) {
		throw FormatError("Dialect configuration must be a JSON object");
	}

	auto config = DialectConfig::modernWiki();
	try {
		config.states = jc.value("states", config.states);
		config.ignoredSections = jc.value("ignoredSections", config.ignoredSections);
		config.directions = jc.value("directions", config.directions);
		config.noFieldsMarker = jc.value("noFieldsMarker", config.noFieldsMarker);
		config.packetIdHeader = jc.value("packetIdHeader", config.packetIdHeader);
		config.fieldNameHeader = jc.value("fieldNameHeader", config.fieldNameHeader);
		config.fieldTypeHeader = jc.value("fieldTypeHeader", config.fieldTypeHeader);
		config.maxNestingDepth = jc.value("maxNestingDepth", config.maxNestingDepth);
		config.skipPacketsWithoutTable = jc.value("skipPacketsWithoutTable", config.skipPacketsWithoutTable);
	}
	catch (const nlohmann::json::type_error& e) {
		throw FormatError(fmt::format("Dialect configuration has a member of the wrong type: {}", e.what()));
	}
	return config;
}
