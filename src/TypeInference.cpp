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
#include <memory>
#include <utility>
#include <fmt/format.h>
#include "packet_miner/PacketMiner.h"
#include "PacketMinerImpl.h"

namespace {
	// Last view row covered by a cell of `rowspan` rows starting at row y, clipped to n rows.
	size_t lastRowOf(size_t y, size_t rowspan, size_t n) noexcept {
		return y + std::min(std::max<size_t>(rowspan, 1), n - y) - 1;
	}
}

packet_miner::TypeInference::TypeInference() : TypeInference(DialectConfig::modernWiki()) {}

packet_miner::TypeInference::TypeInference(const DialectConfig& config, TypeResolver resolver) :
	marker_{ config.noFieldsMarker },
	maxDepth_{ config.maxNestingDepth },
	resolver_{ std::move(resolver) }
{}

auto packet_miner::TypeInference::resolveType(std::string_view content) const -> TypeNode {
	if (resolver_) {
		return resolver_(content);
	}
	return TypeNode{ LeafType{ std::string(content) } };
}

bool packet_miner::TypeInference::isNoFieldsMarker(const CellRef& cell) const {
	return pm_impl::trimView(cell.content()) == marker_;
}

auto packet_miner::TypeInference::inferFields(const GridView& names, const GridView& types) const -> CompositeList {
	return inferFields(names, types, 0);
}

auto packet_miner::TypeInference::inferFields(const GridView& names, const GridView& types, size_t depth) const -> CompositeList {
	if (depth > maxDepth_) {
		throw DepthLimitError(fmt::format("Composite fields nest deeper than {} levels", maxDepth_));
	}
	// Only heights have to agree; enum style tables make the widths differ.
	if (names.height() != types.height()) {
		throw SymmetryError(fmt::format("Field name column has {} rows but field type column has {}", names.height(), types.height()));
	}

	CompositeList res{};
	for (size_t y = 0, n = names.height(); y < n; ++y) {
		auto nameRow = names.row(y);
		auto typeRow = types.row(y);

		if (nameRow.size() != typeRow.size()) {
			if (not nameRow.empty() and isNoFieldsMarker(nameRow.front())) {
				y = lastRowOf(y, nameRow.front().rowspan(), n);
				continue;
			}
			throw SymmetryError(fmt::format("Row {} has {} name cells but {} type cells", y, nameRow.size(), typeRow.size()));
		}

		if (nameRow.empty()) {
			continue;
		}
		if (nameRow.size() == 1) {
			res.fields.push_back({ nameRow.front().content(), resolveType(typeRow.front().content()) });
			continue;
		}

		// The first cell's rowspan is the number of rows the composite groups.
		auto nameHead = nameRow.front();
		auto typeHead = typeRow.front();
		if (nameHead.rowspan() != typeHead.rowspan()) {
			throw SymmetryError(fmt::format("\"{}\" spans {} name rows but {} type rows", nameHead.content(), nameHead.rowspan(), typeHead.rowspan()));
		}
		auto nested = inferFields(
			names.crop(nameHead.colspan(), nameHead.y(), NPOS, nameHead.rowspan()),
			types.crop(nameHead.colspan(), nameHead.y(), NPOS, nameHead.rowspan()),
			depth + 1);

		PairedType paired{
			std::make_shared<const TypeNode>(resolveType(typeHead.content())),
			std::make_shared<const TypeNode>(TypeNode{ std::move(nested) })
		};
		res.fields.push_back({ nameHead.content(), TypeNode{ std::move(paired) } });
		y = lastRowOf(y, nameHead.rowspan(), n);
	}
	return res;
}
