/*

header.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <mimetree/detail/ascii.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Ordered multi-map of header fields.

Fields keep their original casing and document order; lookup by name is case insensitive. A name may repeat, each occurrence keeping its
own value.
**/
class MIMETREE_EXPORT header_map
{
public:

    using field_t = std::pair<std::string, std::string>;
    using const_iterator = std::vector<field_t>::const_iterator;

    /**
    Appending a field, keeping any previous field of the same name.

    @param name  Field name as found in the document.
    @param value Raw field value.
    **/
    void add(std::string name, std::string value)
    {
        index_[detail::to_lower_ascii(name)].push_back(fields_.size());
        fields_.emplace_back(std::move(name), std::move(value));
    }

    /**
    Replacing every field of the given name by a single one.

    The new field takes the position of the first replaced occurrence, or is appended if the name is not present.

    @param name  Field name.
    @param value Field value.
    **/
    void set(std::string name, std::string value)
    {
        const std::string key = detail::to_lower_ascii(name);
        auto it = index_.find(key);
        if (it == index_.end() || it->second.empty())
        {
            add(std::move(name), std::move(value));
            return;
        }

        const std::size_t keep = it->second.front();
        fields_[keep] = field_t(std::move(name), std::move(value));
        if (it->second.size() > 1)
        {
            std::vector<std::size_t> drop(it->second.begin() + 1, it->second.end());
            erase_positions(drop);
        }
    }

    /**
    Removing every field of the given name.

    @param name Field name.
    @return     Number of removed fields.
    **/
    std::size_t erase(std::string_view name)
    {
        auto it = index_.find(detail::to_lower_ascii(name));
        if (it == index_.end())
            return 0;
        std::vector<std::size_t> drop = it->second;
        erase_positions(drop);
        return drop.size();
    }

    /**
    First value of the given field.

    @param name Field name.
    @return     The value, or empty string if the field is missing.
    **/
    [[nodiscard]] std::string get(std::string_view name) const
    {
        auto it = index_.find(detail::to_lower_ascii(name));
        if (it == index_.end() || it->second.empty())
            return {};
        return fields_[it->second.front()].second;
    }

    /**
    All values of the given field, in document order.
    **/
    [[nodiscard]] std::vector<std::string> get_all(std::string_view name) const
    {
        std::vector<std::string> values;
        auto it = index_.find(detail::to_lower_ascii(name));
        if (it == index_.end())
            return values;
        values.reserve(it->second.size());
        for (std::size_t pos : it->second)
            values.push_back(fields_[pos].second);
        return values;
    }

    [[nodiscard]] bool contains(std::string_view name) const
    {
        auto it = index_.find(detail::to_lower_ascii(name));
        return it != index_.end() && !it->second.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return fields_.begin(); }

    [[nodiscard]] const_iterator end() const noexcept { return fields_.end(); }

    [[nodiscard]] const field_t& operator[](std::size_t pos) const { return fields_[pos]; }

private:

    /**
    Removing fields at the given positions and rebuilding the index.
    **/
    void erase_positions(const std::vector<std::size_t>& positions)
    {
        std::vector<bool> dropped(fields_.size(), false);
        for (std::size_t pos : positions)
            dropped[pos] = true;

        std::vector<field_t> kept;
        kept.reserve(fields_.size() - positions.size());
        for (std::size_t i = 0; i < fields_.size(); ++i)
            if (!dropped[i])
                kept.push_back(std::move(fields_[i]));
        fields_ = std::move(kept);

        index_.clear();
        for (std::size_t i = 0; i < fields_.size(); ++i)
            index_[detail::to_lower_ascii(fields_[i].first)].push_back(i);
    }

    std::vector<field_t> fields_;

    /**
    Lowercase field name to positions in `fields_`.
    **/
    std::unordered_map<std::string, std::vector<std::size_t>> index_;
};


} // namespace mimetree
