#ifndef SAMPLE_TABLES_H
#define SAMPLE_TABLES_H
#include <string_view>

namespace pm_test {
	// Merchant Offers as documented on the protocol page: one colspan row, then a
	// ten row "Trades" group, then four more colspan rows.
	inline constexpr std::string_view merchantOffersTable = R"wiki({| class="wikitable"
! Packet ID
! State
! Bound To
! colspan="2"| Field Name
! colspan="2"| Field Type
! Notes
|-
| rowspan="15"| ''protocol:''<br/><code>0x2D</code><br/><br/>''resource:''<br/><code>merchant_offers</code>
| rowspan="15"| Play
| rowspan="15"| Client
| colspan="2"| Window ID
| colspan="2"| {{Type|VarInt}}
| The ID of the window that is open; this is an int rather than a byte.
|-
| rowspan="10"| Trades
| Input item 1
| rowspan="10"| {{Type|Prefixed Array}}
| Trade Item
| See below. The first item the player has to supply for this villager trade. The count of the item stack is the default "price" of this trade.
|-
| Output item
| {{Type|Slot}}
| The item the player will receive from this villager trade.
|-
| Input item 2
| {{Type|Prefixed Optional}} Trade Item
| The second item the player has to supply for this villager trade.
|-
| Trade disabled
| {{Type|Boolean}}
| True if the trade is disabled; false if the trade is enabled.
|-
| Number of trade uses
| {{Type|Int}}
| Number of times the trade has been used so far. If equal to the maximum number of trades, the client will display a red X.
|-
| Maximum number of trade uses
| {{Type|Int}}
| Number of times this trade can be used before it's exhausted.
|-
| XP
| {{Type|Int}}
| Amount of XP the villager will earn each time the trade is used.
|-
| Special Price
| {{Type|Int}}
| Can be zero or negative. The number is added to the price when an item is discounted due to player reputation or other effects.
|-
| Price Multiplier
| {{Type|Float}}
| Can be low (0.05) or high (0.2). Determines how much demand, player reputation, and temporary effects will adjust the price.
|-
| Demand
| {{Type|Int}}
| If positive, causes the price to increase. Negative values seem to be treated the same as zero.
|-
| colspan="2"| Villager level
| colspan="2"| {{Type|VarInt}}
| Appears on the trade GUI; meaning comes from the translation key <code>merchant.level.</code> + level.
1: Novice, 2: Apprentice, 3: Journeyman, 4: Expert, 5: Master.
|-
| colspan="2"| Experience
| colspan="2"| {{Type|VarInt}}
| Total experience for this villager (always 0 for the wandering trader).
|-
| colspan="2"| Is regular villager
| colspan="2"| {{Type|Boolean}}
| True if this is a regular villager; false for the wandering trader.  When false, hides the villager level and some other GUI elements.
|-
| colspan="2"| Can restock
| colspan="2"| {{Type|Boolean}}
| True for regular villagers and false for the wandering trader. If true, the "Villagers restock up to two times per day." message is displayed when hovering over disabled trades.
|})wiki";

	inline constexpr std::string_view legacyPingTable = R"wiki({| class="wikitable"
! Packet ID
! State
! Bound To
! Field Name
! Field Type
! Notes
|-
| 0xFE
| Status
| Server
| Payload
| {{Type|Unsigned Byte}}
| always 1 (<code>0x01</code>).
|})wiki";

	inline constexpr std::string_view noFieldsTable = R"wiki({| class="wikitable"
! Packet ID
! State
! Bound To
! Field Name
! Field Type
! Notes
|-
| ''protocol:''<br/><code>0x00</code><br/><br/>''resource:''<br/><code>status_request</code>
| Status
| Server
| colspan="3"| ''no fields''
|})wiki";

	inline constexpr std::string_view asymmetricTable = R"wiki({| class="wikitable"
! Packet ID
! State
! Bound To
! Field Name
! Field Type
! Notes
|-
| rowspan="2"| ''protocol:''<br/><code>0x01</code>
| rowspan="2"| Play
| rowspan="2"| Client
| Entity ID
| {{Type|VarInt}}
|
|-
| colspan="3"| Flags, see below
|})wiki";
}

#endif
