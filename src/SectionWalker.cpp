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
#include <ostream>
#include <utility>
#include <fmt/format.h>
#include "packet_miner/PacketMiner.h"

packet_miner::SectionWalker::SectionWalker(DialectConfig config, std::ostream& log) :
	config_{ std::move(config) },
	assembler_{ config_, log },
	log_{ log }
{}

auto packet_miner::SectionWalker::walk(const Section& root) const -> PacketBatch {
	PacketBatch batch{};
	for (const auto& state : root.children) {
		if (config_.isIgnored(state.name)) {
			continue;
		}
		// Only known states are walked, anything else means the page changed shape
		if (not config_.isState(state.name)) {
			throw DialectError(fmt::format("Unknown wiki header '{}'", state.name));
		}

		for (const auto& direction : state.children) {
			if (not config_.isDirection(direction.name)) {
				throw DialectError(fmt::format("Unknown destination '{}' under '{}'", direction.name, state.name));
			}
			for (const auto& packetSection : direction.children) {
				PacketEntry entry{ state.name, direction.name, packetSection.name, std::nullopt };
				try {
					entry.packet = assembler_.assemble(packetSection.name, packetSection.text);
				}
				catch (const MissingTableError& e) {
					if (not config_.skipPacketsWithoutTable) {
						throw;
					}
					log_ << fmt::format("{} Skipped.\n", e.what());
				}
				batch.entries.push_back(std::move(entry));
			}
		}
	}
	return batch;
}

size_t packet_miner::PacketBatch::skipped() const noexcept {
	return static_cast<size_t>(std::count_if(entries.begin(), entries.end(), [](const PacketEntry& e) { return not e.packet; }));
}

auto packet_miner::PacketBatch::find(std::string_view name) const noexcept -> const Packet* {
	for (const auto& entry : entries) {
		if (entry.packet and entry.name == name) {
			return &*entry.packet;
		}
	}
	return nullptr;
}
