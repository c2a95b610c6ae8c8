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

#ifndef PACKET_MINER_IMPL_H
#define PACKET_MINER_IMPL_H
#include <optional>
#include <string_view>
#include <tao/pegtl/memory_input.hpp>
#include "packet_miner/CellInfoTags.h"
#include "packet_miner/PacketMiner.h"

namespace pm_impl {
	namespace peggi = TAO_PEGTL_NAMESPACE;
	using mem_input = peggi::memory_input<peggi::tracking_mode::eager>;

	auto trimView(std::string_view str) noexcept -> std::string_view;

	// Pops the next line off text (without its line terminator); nothing once text is exhausted.
	auto consumeLine(std::string_view& text) noexcept -> std::optional<std::string_view>;

	auto classifyLine(std::string_view line) noexcept -> packet_miner::LineKind;

	/**
	Consumes any number of colspan="N" / rowspan="N" pairs in front of cell content.
	throws: packet_miner::FormatError on an attribute without a quoted positive integer
	*/
	auto trySpanAttributes(mem_input& input) -> packet_miner::SpanAttributes;

	auto tryPacketIdGroups(mem_input& input) -> std::optional<packet_miner::PacketIdFields>;
	bool tryLegacyPacketId(std::string_view text) noexcept;

	// Heading level and title of a "== Title ==" line.
	auto tryHeading(std::string_view line) noexcept -> std::optional<std::pair<size_t, std::string_view>>;
}
#endif
