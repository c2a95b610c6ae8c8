#include <memory>
#include <sstream>
#include "packet_miner/PacketMiner.h"
#include "SampleTables.h"
#include <gtest/gtest.h>

namespace {
	using namespace packet_miner;

	TypeNode leaf(std::string text) {
		return TypeNode{ LeafType{ std::move(text) } };
	}

	TEST(PMSchemaExportTest, DebugStringNesting) {
		CompositeList inner{ { { "c", leaf("C") } } };
		PairedType paired{ std::make_shared<const TypeNode>(leaf("B")), std::make_shared<const TypeNode>(TypeNode{ inner }) };
		CompositeList outer{ { { "a", leaf("A") }, { "b", TypeNode{ paired } } } };

		EXPECT_EQ(debugString(leaf("{{Type|VarInt}}")), "{{Type|VarInt}}");
		EXPECT_EQ(debugString(TypeNode{ paired }), "B & {\n\tc : C\n}");
		EXPECT_EQ(debugString(TypeNode{ outer }), "{\n\ta : A\n\tb : B & {\n\t\tc : C\n\t}\n}");
		EXPECT_EQ(debugString(TypeNode{ CompositeList{} }), "{\n}");
	}

	TEST(PMSchemaExportTest, PacketHeaderLine) {
		std::ostringstream log;
		PacketAssembler assembler{ DialectConfig::modernWiki(), log };

		auto legacy = assembler.assemble("Legacy Server List Ping", pm_test::legacyPingTable);
		ASSERT_TRUE(legacy);
		std::ostringstream out;
		EXPECT_TRUE(schemaExport(*legacy, out));
		EXPECT_EQ(out.str(), "Legacy Server List Ping [protocol: 0xFE]\n{\n\tPayload : {{Type|Unsigned Byte}}\n}\n");

		auto request = assembler.assemble("Status Request", pm_test::noFieldsTable);
		ASSERT_TRUE(request);
		std::ostringstream empty;
		EXPECT_TRUE(schemaExport(*request, empty));
		EXPECT_EQ(empty.str(), "Status Request [protocol: 0x00, resource: status_request]\n{\n}\n");
	}

	TEST(PMSchemaExportTest, MerchantTradesAreIndented) {
		std::ostringstream log;
		PacketAssembler assembler{ DialectConfig::modernWiki(), log };
		auto packet = assembler.assemble("Merchant Offers", pm_test::merchantOffersTable);
		ASSERT_TRUE(packet);

		std::ostringstream out;
		ASSERT_TRUE(schemaExport(*packet, out));
		auto text = out.str();
		EXPECT_NE(text.find("\n\tTrades : {{Type|Prefixed Array}} & {\n\t\tInput item 1 : Trade Item\n"), std::string::npos);
		EXPECT_NE(text.find("\n\t\tDemand : {{Type|Int}}\n\t}\n\tVillager level : {{Type|VarInt}}\n"), std::string::npos);
	}

	TEST(PMSchemaExportTest, SingleCellShape) {
		auto parsed = buildGrid("{|\n| a\n|}");
		EXPECT_EQ(renderGridShape(parsed.table), " ────\n│    │\n ────\n\n");
	}

	TEST(PMSchemaExportTest, SpanShape) {
		auto parsed = buildGrid("{|\n| colspan=\"2\"| a\n|-\n| b\n| c\n|}");
		auto shape = renderGridShape(parsed.table, 3, 1);
		EXPECT_EQ(shape, " ─────\n ─────\n ── ──\n");
	}
}
