#include <string_view>
#include "packet_miner/PacketMiner.h"
#include <gtest/gtest.h>

namespace {
	using packet_miner::splitSections;

	constexpr std::string_view page = R"wiki(This page presents a dissection of the current protocol.

== Definitions ==
Data types are described on their own page.

== Status ==
=== Clientbound ===
==== Status Response ====
Sent by the server.
{| class="wikitable"
|}
==== Pong Response ====
Echo of the payload.
=== Serverbound ===
==== Status Request ====
Sent by the client.
== Play ==
=== Clientbound ===
)wiki";

	TEST(PMSectionTreeTest, RootKeepsLeadingText) {
		auto root = splitSections(page);
		EXPECT_EQ(root.name, "root");
		EXPECT_EQ(root.text, "This page presents a dissection of the current protocol.");
	}

	TEST(PMSectionTreeTest, NestsByHeadingLevel) {
		auto root = splitSections(page);
		ASSERT_EQ(root.children.size(), 3u);
		EXPECT_EQ(root.children[0].name, "Definitions");
		EXPECT_EQ(root.children[1].name, "Status");
		EXPECT_EQ(root.children[2].name, "Play");

		const auto& status = root.children[1];
		ASSERT_EQ(status.children.size(), 2u);
		EXPECT_EQ(status.children[0].name, "Clientbound");
		EXPECT_EQ(status.children[1].name, "Serverbound");

		const auto& clientbound = status.children[0];
		ASSERT_EQ(clientbound.children.size(), 2u);
		EXPECT_EQ(clientbound.children[0].name, "Status Response");
		EXPECT_EQ(clientbound.children[1].name, "Pong Response");
		ASSERT_EQ(status.children[1].children.size(), 1u);
		EXPECT_EQ(status.children[1].children[0].name, "Status Request");

		ASSERT_EQ(root.children[2].children.size(), 1u);
		EXPECT_TRUE(root.children[2].children[0].children.empty());
	}

	TEST(PMSectionTreeTest, SectionTextIsTrimmedBody) {
		auto root = splitSections(page);
		EXPECT_EQ(root.children[0].text, "Data types are described on their own page.");
		EXPECT_TRUE(root.children[1].text.empty());

		const auto& response = root.children[1].children[0].children[0];
		EXPECT_EQ(response.text, "Sent by the server.\n{| class=\"wikitable\"\n|}");
		EXPECT_EQ(root.children[1].children[0].children[1].text, "Echo of the payload.");
	}

	TEST(PMSectionTreeTest, HeadingSpacingAndUnevenMarkers) {
		auto root = splitSections("==Status==\n===  Clientbound   ===  \n=== Serverbound ==\n");
		// the shorter marker decides the level
		ASSERT_EQ(root.children.size(), 2u);
		const auto& status = root.children[0];
		EXPECT_EQ(status.name, "Status");
		ASSERT_EQ(status.children.size(), 1u);
		EXPECT_EQ(status.children[0].name, "Clientbound");
		EXPECT_EQ(root.children[1].name, "Serverbound");
	}

	TEST(PMSectionTreeTest, NonHeadingLinesStayText) {
		auto root = splitSections("a == b == c\n== \n==\n");
		EXPECT_TRUE(root.children.empty());
		EXPECT_EQ(root.text, "a == b == c\n== \n==");
	}

	TEST(PMSectionTreeTest, DeeperJumpAndReturn) {
		auto root = splitSections("== A ==\n==== Deep ====\n=== Mid ===\n== B ==\n");
		ASSERT_EQ(root.children.size(), 2u);
		const auto& a = root.children[0];
		ASSERT_EQ(a.children.size(), 2u);
		EXPECT_EQ(a.children[0].name, "Deep");
		EXPECT_EQ(a.children[1].name, "Mid");
		EXPECT_EQ(root.children[1].name, "B");
	}

	TEST(PMSectionTreeTest, EmptyPage) {
		auto root = splitSections("");
		EXPECT_EQ(root.name, "root");
		EXPECT_TRUE(root.text.empty());
		EXPECT_TRUE(root.children.empty());
	}
}
