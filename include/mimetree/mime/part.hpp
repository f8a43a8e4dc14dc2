/*

part.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <mimetree/mime/header.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Index of a part inside its tree.
**/
using part_id = std::size_t;


/**
Storage of one MIME part. Links are indexes into the owning tree.
**/
struct MIMETREE_EXPORT part_node
{
    std::optional<part_id> parent;
    std::optional<part_id> first_child;
    std::optional<part_id> next_sibling;
    std::size_t depth = 0;
    header_map header;
    std::string content_type;
    std::string disposition;
    std::string file_name;
    std::string content;
};


class part_tree;

namespace detail
{
class tree_builder;
} // namespace detail


/**
Read-only handle on a part of a tree. Valid as long as the tree is alive and not moved from.
**/
class MIMETREE_EXPORT part
{
public:

    part(const part_tree& tree, part_id id) : tree_(&tree), id_(id)
    {
    }

    [[nodiscard]] part_id id() const noexcept { return id_; }

    /**
    Enclosing part, none for the root.
    **/
    [[nodiscard]] std::optional<part> parent() const;

    [[nodiscard]] std::optional<part> first_child() const;

    [[nodiscard]] std::optional<part> next_sibling() const;

    /**
    Children in document order.
    **/
    [[nodiscard]] std::vector<part> children() const;

    [[nodiscard]] const header_map& header() const;

    /**
    Media type without parameters, e.g. `text/plain`.
    **/
    [[nodiscard]] const std::string& content_type() const;

    /**
    Disposition without parameters, empty if absent or unparsable.
    **/
    [[nodiscard]] const std::string& disposition() const;

    /**
    File name from the disposition or the content type, decoded to UTF-8.
    **/
    [[nodiscard]] const std::string& file_name() const;

    /**
    Decoded content, empty for multipart parts.
    **/
    [[nodiscard]] const std::string& content() const;

    /**
    Multipart nesting level, zero for the root.
    **/
    [[nodiscard]] std::size_t depth() const;

    [[nodiscard]] bool is_leaf() const;

    friend bool operator==(const part& lhs, const part& rhs) noexcept
    {
        return lhs.tree_ == rhs.tree_ && lhs.id_ == rhs.id_;
    }

private:

    const part_node& node() const;

    const part_tree* tree_;
    part_id id_;
};


/**
Tree of MIME parts built by the parser.

Parts are kept in an arena in document order, the root first. The tree is immutable once returned by the parser and released as a whole.
**/
class MIMETREE_EXPORT part_tree
{
public:

    part_tree() = default;

    part_tree(const part_tree&) = default;

    part_tree(part_tree&&) = default;

    part_tree& operator=(const part_tree&) = default;

    part_tree& operator=(part_tree&&) = default;

    ~part_tree() = default;

    [[nodiscard]] part root() const
    {
        return part(*this, 0);
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return nodes_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return nodes_.empty();
    }

    /**
    Part of the given index.

    @throw std::out_of_range Index out of the tree.
    **/
    [[nodiscard]] part at(part_id id) const
    {
        (void)nodes_.at(id);
        return part(*this, id);
    }

    [[nodiscard]] const part_node& node(part_id id) const
    {
        return nodes_[id];
    }

    /**
    Visiting every part depth first, parents before their children.

    @param visitor Called for each part; returning false stops the walk.
    **/
    void walk(const std::function<bool(const part&)>& visitor) const
    {
        if (nodes_.empty())
            return;
        std::vector<part_id> stack{0};
        while (!stack.empty())
        {
            const part_id id = stack.back();
            stack.pop_back();
            if (!visitor(part(*this, id)))
                return;

            std::vector<part_id> kids;
            for (auto child = nodes_[id].first_child; child; child = nodes_[*child].next_sibling)
                kids.push_back(*child);
            stack.insert(stack.end(), kids.rbegin(), kids.rend());
        }
    }

    /**
    First part in depth first order matching the predicate.
    **/
    [[nodiscard]] std::optional<part> find_if(const std::function<bool(const part&)>& pred) const
    {
        std::optional<part> found;
        walk([&found, &pred](const part& p)
        {
            if (!pred(p))
                return true;
            found = p;
            return false;
        });
        return found;
    }

    /**
    Parts without children, in document order.
    **/
    [[nodiscard]] std::vector<part> leaves() const
    {
        std::vector<part> out;
        walk([&out](const part& p)
        {
            if (p.is_leaf())
                out.push_back(p);
            return true;
        });
        return out;
    }

private:

    friend class detail::tree_builder;

    /**
    Appending a part under the given parent, after `prev_sibling` if any.

    @return Index of the new part.
    **/
    part_id append(std::optional<part_id> parent, std::optional<part_id> prev_sibling, std::string content_type)
    {
        const part_id id = nodes_.size();
        part_node& node = nodes_.emplace_back();
        node.parent = parent;
        node.content_type = std::move(content_type);
        if (parent)
        {
            node.depth = nodes_[*parent].depth + 1;
            if (prev_sibling)
                nodes_[*prev_sibling].next_sibling = id;
            else
                nodes_[*parent].first_child = id;
        }
        return id;
    }

    part_node& mutable_node(part_id id)
    {
        return nodes_[id];
    }

    std::vector<part_node> nodes_;
};


inline const part_node& part::node() const
{
    return tree_->node(id_);
}

inline std::optional<part> part::parent() const
{
    const auto& link = node().parent;
    return link ? std::optional<part>(part(*tree_, *link)) : std::nullopt;
}

inline std::optional<part> part::first_child() const
{
    const auto& link = node().first_child;
    return link ? std::optional<part>(part(*tree_, *link)) : std::nullopt;
}

inline std::optional<part> part::next_sibling() const
{
    const auto& link = node().next_sibling;
    return link ? std::optional<part>(part(*tree_, *link)) : std::nullopt;
}

inline std::vector<part> part::children() const
{
    std::vector<part> out;
    for (auto child = first_child(); child; child = child->next_sibling())
        out.push_back(*child);
    return out;
}

inline const header_map& part::header() const
{
    return node().header;
}

inline const std::string& part::content_type() const
{
    return node().content_type;
}

inline const std::string& part::disposition() const
{
    return node().disposition;
}

inline const std::string& part::file_name() const
{
    return node().file_name;
}

inline const std::string& part::content() const
{
    return node().content;
}

inline std::size_t part::depth() const
{
    return node().depth;
}

inline bool part::is_leaf() const
{
    return !node().first_child.has_value();
}


} // namespace mimetree
