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
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <fmt/format.h>
#include "PacketMinerImpl.h"

#include "tao/pegtl.hpp"
#include "ctre.hpp"

namespace {
	struct SpanParseState {
		packet_miner::SpanAttributes attrs;
		size_t*                     target;
	};

	struct PacketIdParseState {
		std::string                   key;
		packet_miner::PacketIdFields fields;
	};
}

namespace wikilang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct hspace0 : star<one<' ', '\t'>> {};

	// colspan="2"| Field Name
	struct colspan_key : TAO_PEGTL_STRING("colspan") {};
	struct rowspan_key : TAO_PEGTL_STRING("rowspan") {};
	struct span_value : plus<digit> {};
	struct quoted_span_value : seq<one<'"'>, span_value, one<'"'>> {};
	struct span_attribute : seq<sor<colspan_key, rowspan_key>, hspace0, one<'='>, hspace0, must<quoted_span_value>, hspace0> {};
	struct span_attributes : star<span_attribute> {};
	struct cell_prefix : seq<hspace0, span_attributes, opt<one<'|'>>, hspace0> {};

	template <typename Rule>
	struct span_action : nothing<Rule> {};
	template <>
	struct span_action<colspan_key> {
		template<typename ActionInput>
		static void apply(const ActionInput&, SpanParseState& s) noexcept {
			s.target = &s.attrs.colspan;
		}
	};
	template <>
	struct span_action<rowspan_key> {
		template<typename ActionInput>
		static void apply(const ActionInput&, SpanParseState& s) noexcept {
			s.target = &s.attrs.rowspan;
		}
	};
	template <>
	struct span_action<span_value> {
		template<typename ActionInput>
		static void apply(const ActionInput& in, SpanParseState& s) {
			size_t value{};
			auto [ptr, ec] = std::from_chars(in.begin(), in.end(), value);
			if (ec != std::errc{} or ptr != in.end() or value == 0 or value > packet_miner::MAX_SPAN) {
				throw packet_miner::FormatError(fmt::format("Span attribute must be an integer in [1, {}], got \"{}\"", packet_miner::MAX_SPAN, in.string()));
			}
			*s.target = value;
		}
	};
}

namespace wikilang {
	using namespace TAO_PEGTL_NAMESPACE;

	// ''protocol:''<br/><code>0x2D</code><br/><br/>''resource:''<br/><code>merchant_offers</code>
	struct id_space : star<space> {};
	struct line_break : seq<one<'<'>, istring<'b', 'r'>, until<one<'>'>>> {};
	struct line_breaks : star<seq<id_space, line_break>> {};
	struct key_open : TAO_PEGTL_STRING("''") {};
	struct key_close : TAO_PEGTL_STRING(":''") {};
	struct id_key : plus<seq<not_at<key_close>, not_one<'\n', '<'>>> {};
	struct code_open : TAO_PEGTL_STRING("<code>") {};
	struct code_close : TAO_PEGTL_STRING("</code>") {};
	struct id_value : star<not_one<'<'>> {};
	struct id_group : seq<id_space, key_open, id_key, key_close, line_breaks, id_space, code_open, id_value, code_close, line_breaks> {};
	struct packet_id : seq<plus<id_group>, id_space, eof> {};

	template <typename Rule>
	struct packet_id_action : nothing<Rule> {};
	template <>
	struct packet_id_action<id_key> {
		template<typename ActionInput>
		static void apply(const ActionInput& in, PacketIdParseState& s) {
			s.key = in.string();
		}
	};
	template <>
	struct packet_id_action<id_value> {
		template<typename ActionInput>
		static void apply(const ActionInput& in, PacketIdParseState& s) {
			s.fields[s.key] = std::string(pm_impl::trimView(in.string()));
		}
	};
}

static constexpr auto legacyIdPattern = ctll::fixed_string{ "0x[0-9A-Fa-f]+" };
static constexpr auto headingPattern = ctll::fixed_string{ "(=+)[ \t]*(.*?)[ \t]*(=+)[ \t]*" };

auto pm_impl::trimView(std::string_view str) noexcept -> std::string_view {
	auto start = str.find_first_not_of(" \t\r\n");
	if (start == std::string_view::npos) {
		return str.substr(str.size());
	}
	auto end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

auto pm_impl::consumeLine(std::string_view& text) noexcept -> std::optional<std::string_view> {
	if (text.empty()) {
		return std::nullopt;
	}
	auto pos = text.find('\n');
	std::string_view line = text.substr(0, pos);
	text = pos == std::string_view::npos ? text.substr(text.size()) : text.substr(pos + 1);
	if (not line.empty() and line.back() == '\r') {
		line.remove_suffix(1);
	}
	return line;
}

auto pm_impl::classifyLine(std::string_view line) noexcept -> packet_miner::LineKind {
	using packet_miner::LineKind;
	auto s = trimView(line);
	if (s.empty()) {
		return LineKind::Blank;
	}
	if (s.substr(0, 2) == "{|") {
		return LineKind::TableOpen;
	}
	if (s.substr(0, 2) == "|}") {
		return LineKind::TableClose;
	}
	if (s.substr(0, 2) == "|-") {
		return LineKind::RowSeparator;
	}
	switch (s.front()) {
	case '!': return LineKind::HeaderCell;
	case '|': return LineKind::DataCell;
	default: return LineKind::Continuation;
	}
}

auto pm_impl::trySpanAttributes(mem_input& input) -> packet_miner::SpanAttributes {
	SpanParseState state{ {}, nullptr };
	try {
		peggi::parse<wikilang::cell_prefix, wikilang::span_action>(input, state);
	}
	catch (const peggi::parse_error& e) {
		throw packet_miner::FormatError(fmt::format("Malformed span attribute: {}", e.what()));
	}
	return state.attrs;
}

auto pm_impl::tryPacketIdGroups(mem_input& input) -> std::optional<packet_miner::PacketIdFields> {
	PacketIdParseState state{};
	if (not peggi::parse<wikilang::packet_id, wikilang::packet_id_action>(input, state)) {
		return std::nullopt;
	}
	return std::move(state.fields);
}

bool pm_impl::tryLegacyPacketId(std::string_view text) noexcept {
	return static_cast<bool>(ctre::match<legacyIdPattern>(text));
}

auto pm_impl::tryHeading(std::string_view line) noexcept -> std::optional<std::pair<size_t, std::string_view>> {
	auto match = ctre::match<headingPattern>(line);
	if (not match) {
		return std::nullopt;
	}
	auto title = match.get<2>().to_view();
	if (title.empty()) {
		return std::nullopt;
	}
	size_t level = std::min(match.get<1>().to_view().size(), match.get<3>().to_view().size());
	return std::make_pair(level, title);
}
