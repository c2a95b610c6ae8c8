#ifndef PACKET_MINER_GRID_H
#define PACKET_MINER_GRID_H
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "CellInfoTags.h"
#include "packetminer_export.h"

namespace packet_miner {
	constexpr size_t NPOS = static_cast<size_t>(-1);

	/**
	Immutable table layout. All cells live in one array; each row is an index
	range into it, with cells ordered by their x origin.
	*/
	class Grid {
	public:
		PACKETMINER_EXPORT explicit Grid(std::vector<std::vector<Cell>> rows);

		size_t width() const noexcept { return width_; }
		size_t height() const noexcept { return rowBounds_.size() - 1; }

		PACKETMINER_EXPORT auto row(size_t y) const noexcept -> std::pair<const Cell*, const Cell*>;
		const std::vector<Cell>& cells() const noexcept { return cells_; }
	private:
		std::vector<Cell>   cells_;
		std::vector<size_t> rowBounds_;
		size_t              width_;
	};

	// A cell as seen through a view: geometry is rebased on the view's origin.
	class CellRef {
	public:
		CellRef(const Cell& cell, size_t x0, size_t y0) noexcept : cell_{ &cell }, x0_{ x0 }, y0_{ y0 } {}

		const std::string& content() const noexcept { return cell_->content; }
		bool isHeader() const noexcept { return cell_->isHeader; }
		size_t x() const noexcept { return cell_->x - x0_; }
		size_t y() const noexcept { return cell_->y - y0_; }
		size_t rowspan() const noexcept { return cell_->rowspan; }
		size_t colspan() const noexcept { return cell_->colspan; }

		bool covers(size_t px, size_t py) const noexcept {
			return x() <= px and px < x() + colspan() and y() <= py and py < y() + rowspan();
		}
		const Cell& cell() const noexcept { return *cell_; }

		bool operator==(const CellRef& rhs) const noexcept { return cell_ == rhs.cell_ and x0_ == rhs.x0_ and y0_ == rhs.y0_; }
		bool operator!=(const CellRef& rhs) const noexcept { return !operator==(rhs); }
	private:
		const Cell* cell_;
		size_t        x0_;
		size_t        y0_;
	};

	/**
	Rectangular window over a shared Grid. Cropping only narrows the window,
	no cells are copied.
	*/
	class GridView {
	public:
		class Row {
		public:
			class iterator {
			public:
				using iterator_category = std::forward_iterator_tag;
				using value_type = CellRef;
				using difference_type = std::ptrdiff_t;
				using pointer = void;
				using reference = CellRef;

				iterator(const Cell* ptr, size_t x0, size_t y0) noexcept : ptr_{ ptr }, x0_{ x0 }, y0_{ y0 } {}

				CellRef operator*() const noexcept { return CellRef{ *ptr_, x0_, y0_ }; }
				iterator& operator++() noexcept { ++ptr_; return *this; }
				iterator operator++(int) noexcept { iterator tmp = *this; ++ptr_; return tmp; }

				bool operator==(const iterator& rhs) const noexcept { return ptr_ == rhs.ptr_; }
				bool operator!=(const iterator& rhs) const noexcept { return ptr_ != rhs.ptr_; }
			private:
				const Cell* ptr_;
				size_t       x0_;
				size_t       y0_;
			};

			Row(const Cell* first, const Cell* last, size_t x0, size_t y0) noexcept : first_{ first }, last_{ last }, x0_{ x0 }, y0_{ y0 } {}

			size_t size() const noexcept { return static_cast<size_t>(last_ - first_); }
			bool empty() const noexcept { return first_ == last_; }
			CellRef operator[](size_t i) const noexcept { return CellRef{ first_[i], x0_, y0_ }; }
			CellRef front() const noexcept { return CellRef{ *first_, x0_, y0_ }; }

			iterator begin() const noexcept { return { first_, x0_, y0_ }; }
			iterator end() const noexcept { return { last_, x0_, y0_ }; }
		private:
			const Cell* first_;
			const Cell*  last_;
			size_t         x0_;
			size_t         y0_;
		};

		PACKETMINER_EXPORT explicit GridView(std::shared_ptr<const Grid> grid);

		/**
		Keeps the cells whose origin lies in [x0, x0+width) x [y0, y0+height),
		rebased so (x0, y0) becomes (0, 0). NPOS extents run to the edge.
		*/
		PACKETMINER_EXPORT auto crop(size_t x0, size_t y0, size_t width = NPOS, size_t height = NPOS) const -> GridView;

		size_t width() const noexcept { return width_; }
		size_t height() const noexcept { return height_; }

		PACKETMINER_EXPORT Row row(size_t y) const;
		PACKETMINER_EXPORT auto at(size_t x, size_t y) const -> std::optional<CellRef>;
		PACKETMINER_EXPORT auto covering(size_t x, size_t y) const -> std::optional<CellRef>;
		// Headers only ever appear on the first row.
		PACKETMINER_EXPORT auto searchHeaders(const std::function<bool(std::string_view)>& predicate) const -> std::vector<CellRef>;

		size_t originX() const noexcept { return x0_; }
		size_t originY() const noexcept { return y0_; }
		const Grid& grid() const noexcept { return *grid_; }
	private:
		GridView(std::shared_ptr<const Grid> grid, size_t x0, size_t y0, size_t xEnd, size_t height);

		std::shared_ptr<const Grid> grid_;
		size_t     x0_;
		size_t     y0_;
		size_t   xEnd_;
		size_t height_;
		size_t  width_;
	};

	struct TableParseResult {
		GridView          table;
		std::string_view   rest;
	};

	/**
	Reads one wikitable starting at `{|`. The returned rest views the text after
	the closing `|}` line and shares the lifetime of `text`.
	*/
	PACKETMINER_EXPORT auto buildGrid(std::string_view text) -> TableParseResult;
}

#endif
