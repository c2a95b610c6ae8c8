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

#include <istream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include "packet_miner/PacketMiner.h"

auto packet_miner::revisionUrl(uint64_t revisionId) -> std::string {
	return fmt::format("https://minecraft.wiki/api.php?action=query&format=json&prop=revisions&rvslots=*&rvprop=content&revids={}", revisionId);
}

auto packet_miner::pageSourceFromApiResponse(std::istream& in) -> std::string {
	nlohmann::json jc{};
	try {
		in >> jc;
	}
	catch (const nlohmann::json::parse_error& e) {
		throw FormatError(fmt::format("Revision response is not valid JSON: {}", e.what()));
	}

	try {
		const auto& pages = jc.at("query").at("pages");
		if (not pages.is_object() or pages.empty()) {
			throw FormatError("Revision response lists no pages");
		}
		return pages.begin().value().at("revisions").at(0).at("slots").at("main").at("*").get<std::string>();
	}
	catch (const nlohmann::json::exception& e) {
		throw FormatError(fmt::format("Unexpected revision response layout: {}", e.what()));
	}
}
