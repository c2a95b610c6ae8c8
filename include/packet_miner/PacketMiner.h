// PacketMiner.h : packet schemas from protocol wiki tables.
#ifndef PACKET_MINER_H
#define PACKET_MINER_H
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "CellInfoTags.h"
#include "DialectConfig.h"
#include "Errors.h"
#include "Grid.h"
#include "TypeTree.h"
#include "packetminer_export.h"

namespace packet_miner {
	// Hook for turning type cell text into something richer than its text.
	using TypeResolver = std::function<TypeNode(std::string_view)>;

	class TypeInference {
	public:
		PACKETMINER_EXPORT TypeInference();
		PACKETMINER_EXPORT explicit TypeInference(const DialectConfig& config, TypeResolver resolver = {});

		PACKETMINER_EXPORT auto resolveType(std::string_view content) const -> TypeNode;

		/**
		Pairs the rows of a field name column with the rows of a field type column.
		A name cell merged over several rows next to further name cells opens a
		composite field whose rows are inferred recursively.
		throws: SymmetryError when the columns disagree, DepthLimitError when
		composites nest deeper than the configured limit.
		*/
		PACKETMINER_EXPORT auto inferFields(const GridView& names, const GridView& types) const -> CompositeList;
	private:
		auto inferFields(const GridView& names, const GridView& types, size_t depth) const -> CompositeList;
		bool isNoFieldsMarker(const CellRef& cell) const;

		std::string  marker_;
		size_t     maxDepth_;
		TypeResolver resolver_;
	};

	using PacketIdFields = std::map<std::string, std::string>;

	/**
	Decodes the "Packet ID" cell. Either a bare literal such as 0x00, or
	''protocol:''<br/><code>0x2D</code><br/><br/>''resource:''<br/><code>merchant_offers</code>
	throws: DialectError when the text follows neither form.
	*/
	PACKETMINER_EXPORT auto decodePacketId(std::string_view cell) -> PacketIdFields;

	struct Packet {
		std::string                         name;
		std::string                     preamble;
		std::string                   protocolId;
		std::optional<std::string>    resourceId;
		std::vector<FieldNode>            fields;
	};

	class PacketAssembler {
	public:
		PACKETMINER_EXPORT PacketAssembler(DialectConfig config, std::ostream& log);

		/**
		Builds the packet described by one packet section. Returns nothing when the
		field columns are asymmetric; the reason is written to the log.
		throws: MissingTableError, DialectError, FormatError, DepthLimitError
		*/
		PACKETMINER_EXPORT auto assemble(const std::string& name, std::string_view text) const -> std::optional<Packet>;
	private:
		auto assembleTable(const std::string& name, std::string preamble, std::string_view tableText) const -> std::optional<Packet>;

		DialectConfig  config_;
		TypeInference inference_;
		std::ostream&      log_;
	};

	struct Section {
		std::string             name;
		std::string             text;
		std::vector<Section> children;
	};

	// Splits page source on == Heading == lines. The returned root is named "root".
	PACKETMINER_EXPORT auto splitSections(std::string_view page) -> Section;

	struct PacketEntry {
		std::string               state;
		std::string           direction;
		std::string                name;
		std::optional<Packet>    packet;
	};

	struct PacketBatch {
		std::vector<PacketEntry> entries;

		PACKETMINER_EXPORT size_t skipped() const noexcept;
		PACKETMINER_EXPORT auto find(std::string_view name) const noexcept -> const Packet*;
	};

	class SectionWalker {
	public:
		PACKETMINER_EXPORT SectionWalker(DialectConfig config, std::ostream& log);

		/**
		Visits state -> direction -> packet sections below root.
		throws: DialectError on a section name outside the configured dialect.
		*/
		PACKETMINER_EXPORT auto walk(const Section& root) const -> PacketBatch;
	private:
		DialectConfig     config_;
		PacketAssembler assembler_;
		std::ostream&         log_;
	};

	PACKETMINER_EXPORT auto revisionUrl(uint64_t revisionId) -> std::string;
	// Page source out of a saved revisions API reply (format=json, rvslots=*).
	PACKETMINER_EXPORT auto pageSourceFromApiResponse(std::istream& in) -> std::string;

	PACKETMINER_EXPORT auto debugString(const TypeNode& node) -> std::string;
	PACKETMINER_EXPORT bool schemaExport(const Packet& packet, std::ostream& out);
	PACKETMINER_EXPORT auto renderGridShape(const GridView& view, size_t colWidth = 5, size_t rowHeight = 2) -> std::string;
}

#endif
