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
#include <string>
#include <variant>
#include <vector>
#include <fmt/format.h>
#include "packet_miner/PacketMiner.h"
#if defined(__INTELLISENSE__) && defined(__clang__)
#include<ciso646>
#endif

namespace {
	auto indentLines(const std::string& str) -> std::string;
	void rtrimSpaces(std::string& str);
}

auto packet_miner::debugString(const TypeNode& node) -> std::string {
	return std::visit(overloaded{
		[](const LeafType& leaf) -> std::string {
			return leaf.text;
		},
		[](const PairedType& paired) -> std::string {
			std::string descriptor = paired.descriptor ? debugString(*paired.descriptor) : std::string{};
			std::string content = paired.content ? debugString(*paired.content) : std::string{};
			return descriptor + " & " + content;
		},
		[](const CompositeList& list) -> std::string {
			if (list.fields.empty()) {
				return "{\n}";
			}
			std::string body{ "{" };
			for (const auto& field : list.fields) {
				body.append("\n\t");
				body.append(indentLines(fmt::format("{} : {}", field.name, debugString(field.type))));
			}
			body.append("\n}");
			return body;
		}
	}, node.kind);
}

bool packet_miner::schemaExport(const Packet& packet, std::ostream& out) {
	if (packet.resourceId) {
		out << fmt::format("{} [protocol: {}, resource: {}]\n", packet.name, packet.protocolId, *packet.resourceId);
	}
	else {
		out << fmt::format("{} [protocol: {}]\n", packet.name, packet.protocolId);
	}
	out << debugString(TypeNode{ CompositeList{ packet.fields } }) << '\n';
	return out.good();
}

auto packet_miner::renderGridShape(const GridView& view, size_t colWidth, size_t rowHeight) -> std::string {
	const size_t lineCount = (view.height() + 1) * rowHeight;
	const size_t columnCount = (view.width() + 1) * colWidth;
	std::vector<std::vector<const char*>> lines(lineCount, std::vector<const char*>(columnCount, " "));

	auto put = [&lines, lineCount, columnCount](size_t x, size_t y, const char* glyph) {
		if (y < lineCount and x < columnCount) {
			lines[y][x] = glyph;
		}
	};
	for (size_t y = 0; y < view.height(); ++y) {
		for (auto cell : view.row(y)) {
			size_t ox = cell.x() * colWidth;
			size_t oy = cell.y() * rowHeight;
			size_t mx = ox + cell.colspan() * colWidth;
			size_t my = oy + cell.rowspan() * rowHeight;
			for (size_t x = ox + 1; x < mx; ++x) {
				put(x, oy, "─");
				put(x, my, "─");
			}
			for (size_t yy = oy + 1; yy < my; ++yy) {
				put(ox, yy, "│");
				put(mx, yy, "│");
			}
		}
	}

	std::string res{};
	for (const auto& line : lines) {
		std::string text{};
		for (const char* glyph : line) {
			text.append(glyph);
		}
		rtrimSpaces(text);
		res.append(text);
		res.push_back('\n');
	}
	return res;
}

namespace {
	auto indentLines(const std::string& str) -> std::string {
		std::string res{};
		res.reserve(str.size());
		for (char c : str) {
			res.push_back(c);
			if (c == '\n') {
				res.push_back('\t');
			}
		}
		return res;
	}

	void rtrimSpaces(std::string& str) {
		auto end = str.find_last_not_of(' ');
		str.erase(end == std::string::npos ? 0 : end + 1);
	}
}
