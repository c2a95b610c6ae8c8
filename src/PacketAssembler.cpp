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

#include <ostream>
#include <utility>
#include <fmt/format.h>
#include "packet_miner/PacketMiner.h"
#include "PacketMinerImpl.h"

packet_miner::PacketAssembler::PacketAssembler(DialectConfig config, std::ostream& log) :
	config_{ std::move(config) },
	inference_{ config_ },
	log_{ log }
{}

auto packet_miner::PacketAssembler::assemble(const std::string& name, std::string_view text) const -> std::optional<Packet> {
	std::string preamble{};
	std::string_view head = text;
	while (not head.empty()) {
		std::string_view tableText = head;
		auto line = pm_impl::consumeLine(head);
		if (pm_impl::classifyLine(*line) == LineKind::TableOpen) {
			return assembleTable(name, std::move(preamble), tableText);
		}
		preamble.append(*line);
		preamble.push_back('\n');
	}
	throw MissingTableError(fmt::format("Cannot find packet table for {}. Intervention required!", name));
}

auto packet_miner::PacketAssembler::assembleTable(const std::string& name, std::string preamble, std::string_view tableText) const -> std::optional<Packet> {
	std::optional<TableParseResult> parsed{};
	try {
		parsed = buildGrid(tableText);
	}
	catch (const FormatError& e) {
		throw FormatError(fmt::format("{} (packet {})", e.what(), name));
	}
	const GridView& table = parsed->table;

	auto idHeader = table.at(0, 0);
	if (not idHeader or pm_impl::trimView(idHeader->content()) != config_.packetIdHeader) {
		throw DialectError(fmt::format("Packet {} not of expected packet table format. Intervention required!", name));
	}
	auto idCell = table.at(0, 1);
	if (not idCell) {
		throw DialectError(fmt::format("Packet {} has no packet id cell. Intervention required!", name));
	}

	PacketIdFields ids{};
	try {
		ids = decodePacketId(idCell->content());
	}
	catch (const DialectError& e) {
		throw DialectError(fmt::format("{} (packet {})", e.what(), name));
	}
	auto protocol = ids.find("protocol");
	if (protocol == ids.end()) {
		throw DialectError(fmt::format("Packet {} has no protocol id. Intervention required!", name));
	}
	std::optional<std::string> resource{};
	if (auto it = ids.find("resource"); it != ids.end()) {
		resource = it->second;
	}

	auto nameHeaders = table.searchHeaders([this](std::string_view content) { return pm_impl::trimView(content) == config_.fieldNameHeader; });
	auto typeHeaders = table.searchHeaders([this](std::string_view content) { return pm_impl::trimView(content) == config_.fieldTypeHeader; });
	if (nameHeaders.size() != 1 or typeHeaders.size() != 1) {
		throw DialectError(fmt::format("Packet {} has {} \"{}\" and {} \"{}\" headers, expected one of each. Intervention required!",
			name, nameHeaders.size(), config_.fieldNameHeader, typeHeaders.size(), config_.fieldTypeHeader));
	}

	auto nameCol = table.crop(nameHeaders.front().x(), 1, nameHeaders.front().colspan());
	auto typeCol = table.crop(typeHeaders.front().x(), 1, typeHeaders.front().colspan());

	CompositeList schema{};
	try {
		schema = inference_.inferFields(nameCol, typeCol);
	}
	catch (const SymmetryError& e) {
		log_ << fmt::format("Symmetry error in packet {}. Intervention required! ({})\n", name, e.what());
		return std::nullopt;
	}
	catch (const DepthLimitError& e) {
		log_ << fmt::format("Unknown exception condition in {}. Intervention required!\n", name);
		throw DepthLimitError(fmt::format("{} (packet {})", e.what(), name));
	}
	catch (const Error&) {
		log_ << fmt::format("Unknown exception condition in {}. Intervention required!\n", name);
		throw;
	}

	return Packet{ name, std::move(preamble), protocol->second, std::move(resource), std::move(schema.fields) };
}
