#ifndef PACKET_MINER_DIALECT_CONFIG_H
#define PACKET_MINER_DIALECT_CONFIG_H
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>
#include "packetminer_export.h"

namespace packet_miner {
	/**
	Everything that ties the miner to one revision of the protocol page layout.
	When the wiki editors rename a section or a header, this is what changes.
	*/
	struct DialectConfig {
		std::vector<std::string> states;
		std::vector<std::string> ignoredSections;
		std::vector<std::string> directions;

		std::string noFieldsMarker;
		std::string packetIdHeader;
		std::string fieldNameHeader;
		std::string fieldTypeHeader;

		size_t maxNestingDepth;
		bool   skipPacketsWithoutTable;

		PACKETMINER_EXPORT static DialectConfig modernWiki();

		PACKETMINER_EXPORT bool isState(const std::string& name) const;
		PACKETMINER_EXPORT bool isIgnored(const std::string& name) const;
		PACKETMINER_EXPORT bool isDirection(const std::string& name) const;
	};

	// JSON object; present members replace the modernWiki() defaults.
	PACKETMINER_EXPORT auto loadDialectConfig(std::istream& in) -> DialectConfig;
}

#endif
