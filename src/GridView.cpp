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
#include <stdexcept>
#include <fmt/format.h>
#include "packet_miner/Grid.h"
#if defined(__clang__) && defined(__INTELLISENSE__)
#include <ciso646>
#endif

namespace {
	struct CellBeforeColumn {
		bool operator()(const packet_miner::Cell& cell, size_t x) const noexcept { return cell.x < x; }
	};
}

packet_miner::GridView::GridView(std::shared_ptr<const Grid> grid) :
	grid_{ std::move(grid) },
	x0_{ 0 },
	y0_{ 0 },
	xEnd_{ NPOS },
	height_{ grid_->height() },
	width_{ grid_->width() }
{}

packet_miner::GridView::GridView(std::shared_ptr<const Grid> grid, size_t x0, size_t y0, size_t xEnd, size_t height) :
	grid_{ std::move(grid) },
	x0_{ x0 },
	y0_{ y0 },
	xEnd_{ xEnd },
	height_{ height },
	width_{ 0 }
{
	for (size_t y = 0; y < height_; ++y) {
		for (auto cell : row(y)) {
			width_ = std::max(width_, cell.x() + cell.colspan());
		}
	}
}

auto packet_miner::GridView::crop(size_t x, size_t y, size_t width, size_t height) const -> GridView {
	size_t absX = x0_ + x;
	size_t xEnd = xEnd_;
	if (width != NPOS and width <= NPOS - absX) {
		xEnd = std::min(xEnd, absX + width);
	}
	xEnd = std::max(xEnd, absX);

	size_t top = std::min(y, height_);
	size_t rows = std::min(height, height_ - top);
	return GridView{ grid_, absX, y0_ + top, xEnd, rows };
}

auto packet_miner::GridView::row(size_t y) const -> Row {
	if (y >= height_) {
		throw std::out_of_range(fmt::format("Row {} is outside a view of {} rows", y, height_));
	}
	auto [first, last] = grid_->row(y0_ + y);
	auto lo = std::lower_bound(first, last, x0_, CellBeforeColumn{});
	auto hi = xEnd_ == NPOS ? last : std::lower_bound(lo, last, xEnd_, CellBeforeColumn{});
	return Row{ lo, hi, x0_, y0_ };
}

auto packet_miner::GridView::at(size_t x, size_t y) const -> std::optional<CellRef> {
	if (y >= height_) {
		return std::nullopt;
	}
	for (auto cell : row(y)) {
		if (cell.x() == x) {
			return cell;
		}
	}
	return std::nullopt;
}

auto packet_miner::GridView::covering(size_t x, size_t y) const -> std::optional<CellRef> {
	if (y >= height_) {
		return std::nullopt;
	}
	for (size_t r = 0; r <= y; ++r) {
		for (auto cell : row(r)) {
			if (cell.covers(x, y)) {
				return cell;
			}
		}
	}
	return std::nullopt;
}

auto packet_miner::GridView::searchHeaders(const std::function<bool(std::string_view)>& predicate) const -> std::vector<CellRef> {
	std::vector<CellRef> res{};
	if (height_ == 0) {
		return res;
	}
	for (auto cell : row(0)) {
		if (cell.isHeader() and predicate(cell.content())) {
			res.push_back(cell);
		}
	}
	return res;
}
