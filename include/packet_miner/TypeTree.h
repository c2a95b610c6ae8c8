#ifndef PACKET_MINER_TYPE_TREE_H
#define PACKET_MINER_TYPE_TREE_H
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace packet_miner {
	struct TypeNode;
	struct FieldNode;

	// Type text as written in the table, e.g. "{{Type|VarInt}}"
	struct LeafType {
		std::string text;
	};

	// "descriptor & content": a container type and the rows it groups
	struct PairedType {
		std::shared_ptr<const TypeNode> descriptor;
		std::shared_ptr<const TypeNode>    content;
	};

	struct CompositeList {
		std::vector<FieldNode> fields;
	};

	struct TypeNode {
		std::variant<LeafType, PairedType, CompositeList> kind;
	};

	struct FieldNode {
		std::string name;
		TypeNode    type;

		bool isComposite() const noexcept;
		// Descriptor text of the field; empty if the resolver produced no leaf text.
		auto typeText() const -> std::string;
		// Nested fields of a composite, nullptr for a leaf.
		auto nested() const noexcept -> const CompositeList*;
	};

	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

	inline bool FieldNode::isComposite() const noexcept {
		return nested() != nullptr;
	}

	inline auto FieldNode::typeText() const -> std::string {
		const TypeNode* node = &type;
		if (auto paired = std::get_if<PairedType>(&type.kind); paired and paired->descriptor) {
			node = paired->descriptor.get();
		}
		if (auto leaf = std::get_if<LeafType>(&node->kind)) {
			return leaf->text;
		}
		return {};
	}

	inline auto FieldNode::nested() const noexcept -> const CompositeList* {
		if (auto paired = std::get_if<PairedType>(&type.kind); paired and paired->content) {
			return std::get_if<CompositeList>(&paired->content->kind);
		}
		return nullptr;
	}
}

#endif
