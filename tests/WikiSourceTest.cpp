#include <sstream>
#include <string>
#include "packet_miner/PacketMiner.h"
#include <gtest/gtest.h>

namespace {
	using namespace packet_miner;

	TEST(PMWikiSourceTest, RevisionUrl) {
		auto url = revisionUrl(2938097);
		EXPECT_EQ(url.rfind("https://minecraft.wiki/api.php?", 0), 0u);
		EXPECT_NE(url.find("rvslots=*"), std::string::npos);
		EXPECT_NE(url.find("format=json"), std::string::npos);
		EXPECT_EQ(url.substr(url.size() - 14), "revids=2938097");
	}

	TEST(PMWikiSourceTest, ExtractsMainSlot) {
		std::istringstream in{ R"json({
			"batchcomplete": "",
			"query": {
				"pages": {
					"120373": {
						"pageid": 120373,
						"ns": 0,
						"title": "Java Edition protocol/Packets",
						"revisions": [
							{ "slots": { "main": { "contentmodel": "wikitext", "contentformat": "text/x-wiki", "*": "== Play ==\n=== Clientbound ===\n" } } }
						]
					}
				}
			}
		})json" };

		EXPECT_EQ(pageSourceFromApiResponse(in), "== Play ==\n=== Clientbound ===\n");
	}

	TEST(PMWikiSourceTest, RejectsUnexpectedLayouts) {
		std::istringstream notJson{ "<html>" };
		EXPECT_THROW(pageSourceFromApiResponse(notJson), FormatError);

		std::istringstream noPages{ R"json({ "query": { "pages": {} } })json" };
		EXPECT_THROW(pageSourceFromApiResponse(noPages), FormatError);

		std::istringstream noRevisions{ R"json({ "query": { "pages": { "1": { "revisions": [] } } } })json" };
		EXPECT_THROW(pageSourceFromApiResponse(noRevisions), FormatError);

		std::istringstream badRevision{ R"json({ "query": { "badrevids": { "5": { "revid": 5 } } } })json" };
		EXPECT_THROW(pageSourceFromApiResponse(badRevision), FormatError);
	}
}
