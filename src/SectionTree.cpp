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

#include <string>
#include <vector>
#include "packet_miner/PacketMiner.h"
#include "PacketMinerImpl.h"
#if defined(__clang__) && defined(__INTELLISENSE__)
#include <ciso646>
#endif

namespace {
	struct OpenSection {
		size_t                  level;
		packet_miner::Section* node;
	};

	void trimTexts(packet_miner::Section& section);
}

auto packet_miner::splitSections(std::string_view page) -> Section {
	Section root{ "root", {}, {} };
	// A section stays addressable while it is on the stack: its parent only
	// gains siblings after it has been popped.
	std::vector<OpenSection> stack{ { 0, &root } };

	std::string_view head = page;
	while (auto line = pm_impl::consumeLine(head)) {
		auto heading = pm_impl::tryHeading(*line);
		if (not heading) {
			auto& text = stack.back().node->text;
			text.append(*line);
			text.push_back('\n');
			continue;
		}
		auto [level, title] = *heading;
		while (stack.size() > 1 and stack.back().level >= level) {
			stack.pop_back();
		}
		auto& siblings = stack.back().node->children;
		siblings.push_back({ std::string(title), {}, {} });
		stack.push_back({ level, &siblings.back() });
	}

	trimTexts(root);
	return root;
}

namespace {
	void trimTexts(packet_miner::Section& section) {
		section.text = std::string(pm_impl::trimView(section.text));
		for (auto& child : section.children) {
			trimTexts(child);
		}
	}
}
