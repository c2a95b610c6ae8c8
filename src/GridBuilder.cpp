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
#include <string>
#include <string_view>
#include <vector>
#include <fmt/format.h>
#include "packet_miner/Grid.h"
#include "packet_miner/Errors.h"
#include "PacketMinerImpl.h"
#if defined(__clang__) && defined(__INTELLISENSE__)
#include <ciso646>
#endif

namespace {
	struct ActiveSpan {
		size_t       x;
		size_t       y;
		size_t rowspan;
		size_t colspan;
	};

	struct TableBuildState {
		std::vector<std::vector<packet_miner::Cell>> rows;
		std::vector<packet_miner::Cell>        pendingRow;
		std::vector<ActiveSpan>               activeSpans;
		size_t x = 0;
		size_t y = 0;
		bool sawToken = false;
	};

	void closeRow(TableBuildState& st);
	void flushRow(TableBuildState& st);
	void skipCoveredColumns(TableBuildState& st) noexcept;
	void openCell(TableBuildState& st, std::string_view line, bool isHeader);
	void extendCell(TableBuildState& st, std::string_view line);
}

packet_miner::Grid::Grid(std::vector<std::vector<Cell>> rows) : cells_{}, rowBounds_{ 0 }, width_{ 0 } {
	size_t total = 0;
	for (const auto& row : rows) {
		total += row.size();
	}
	cells_.reserve(total);
	rowBounds_.reserve(rows.size() + 1);
	for (auto& row : rows) {
		for (auto& cell : row) {
			width_ = std::max(width_, cell.x + cell.colspan);
			cells_.push_back(std::move(cell));
		}
		rowBounds_.push_back(cells_.size());
	}
}

auto packet_miner::Grid::row(size_t y) const noexcept -> std::pair<const Cell*, const Cell*> {
	const Cell* base = cells_.data();
	return { base + rowBounds_[y], base + rowBounds_[y + 1] };
}

auto packet_miner::buildGrid(std::string_view text) -> TableParseResult {
	std::string_view head = text;
	std::optional<std::string_view> line{};
	while ((line = pm_impl::consumeLine(head)) and pm_impl::classifyLine(*line) == LineKind::Blank) {
	}
	if (not line or pm_impl::classifyLine(*line) != LineKind::TableOpen) {
		throw FormatError(fmt::format("Expected a table to start with \"{{|\", got \"{}\"", line ? *line : std::string_view{}));
	}

	TableBuildState st{};
	while ((line = pm_impl::consumeLine(head))) {
		auto kind = pm_impl::classifyLine(*line);
		if (kind == LineKind::TableClose) {
			break;
		}
		switch (kind) {
		case LineKind::Blank:
			break;
		case LineKind::RowSeparator:
			closeRow(st);
			break;
		case LineKind::HeaderCell:
			openCell(st, *line, true);
			break;
		case LineKind::DataCell:
			openCell(st, *line, false);
			break;
		default:
			extendCell(st, *line);
			break;
		}
	}
	flushRow(st);

	auto grid = std::make_shared<const Grid>(std::move(st.rows));
	return { GridView{ std::move(grid) }, head };
}

namespace {
	void flushRow(TableBuildState& st) {
		st.rows.push_back(std::move(st.pendingRow));
		st.pendingRow.clear();
	}

	void closeRow(TableBuildState& st) {
		// a "|-" straight after "{|" opens the first row rather than ending an empty one
		if (not st.sawToken) {
			st.sawToken = true;
			return;
		}
		flushRow(st);
		++st.y;
		st.x = 0;
		st.activeSpans.erase(std::remove_if(st.activeSpans.begin(), st.activeSpans.end(),
			[&st](const ActiveSpan& span) { return span.y + span.rowspan <= st.y; }), st.activeSpans.end());
	}

	void skipCoveredColumns(TableBuildState& st) noexcept {
		bool moved = true;
		while (moved) {
			moved = false;
			for (const auto& span : st.activeSpans) {
				bool overlapping = span.x <= st.x and span.y <= st.y and span.x + span.colspan > st.x and span.y + span.rowspan > st.y;
				if (overlapping) {
					st.x += span.colspan;
					moved = true;
					break;
				}
			}
		}
	}

	void openCell(TableBuildState& st, std::string_view line, bool isHeader) {
		st.sawToken = true;
		skipCoveredColumns(st);

		auto body = pm_impl::trimView(line).substr(1);
		pm_impl::mem_input input{ body.data(), body.size(), "wikitable cell" };
		auto spans = pm_impl::trySpanAttributes(input);
		std::string_view content{ input.current(), static_cast<size_t>(input.end() - input.current()) };

		packet_miner::Cell cell{ std::string(pm_impl::trimView(content)), isHeader, st.x, st.y, spans.rowspan, spans.colspan };
		if (cell.rowspan > 1) {
			st.activeSpans.push_back({ cell.x, cell.y, cell.rowspan, cell.colspan });
		}
		st.x += cell.colspan;
		st.pendingRow.push_back(std::move(cell));
	}

	void extendCell(TableBuildState& st, std::string_view line) {
		if (st.pendingRow.empty()) {
			throw packet_miner::FormatError(fmt::format("Cannot parse wikitable due to line: \"{}\"", line));
		}
		auto& content = st.pendingRow.back().content;
		content.push_back('\n');
		content.append(pm_impl::trimView(line));
	}
}
