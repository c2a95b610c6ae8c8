#ifndef CELL_INFO_TAGS_H
#define CELL_INFO_TAGS_H
#include <cstddef>
#include <cstdint>
#include <string>

namespace packet_miner {
	// Largest rowspan or colspan a table may declare.
	constexpr size_t MAX_SPAN = 4096;

	struct Cell {
		std::string content;
		bool       isHeader;
		size_t            x;
		size_t            y;
		size_t      rowspan;
		size_t      colspan;
	};

	// Leading attributes of a table cell line, e.g. `rowspan="10"| Trades`
	struct SpanAttributes {
		size_t rowspan = 1;
		size_t colspan = 1;
	};

	enum class LineKind : uint8_t {
		Blank,
		TableOpen,
		TableClose,
		RowSeparator,
		HeaderCell,
		DataCell,
		Continuation
	};
}

#endif
