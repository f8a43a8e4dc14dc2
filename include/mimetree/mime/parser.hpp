/*

parser.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <format>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mimetree/charset/charset_registry.hpp>
#include <mimetree/codec/q_codec.hpp>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/error_detail.hpp>
#include <mimetree/detail/log.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/io/byte_source.hpp>
#include <mimetree/io/line_reader.hpp>
#include <mimetree/mime/decoder.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/mime/header_reader.hpp>
#include <mimetree/mime/media_type.hpp>
#include <mimetree/mime/multipart_reader.hpp>
#include <mimetree/mime/parser_config.hpp>
#include <mimetree/mime/part.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{

namespace detail
{

inline const std::string CONTENT_TYPE_HEADER{"Content-Type"};
inline const std::string CONTENT_DISPOSITION_HEADER{"Content-Disposition"};
inline const std::string CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};
inline const std::string CHARSET_HEADER{"charset"};


/**
Recursive descent over the multipart levels of one document.
**/
class tree_builder
{
public:

    tree_builder(const parser_config& config, const charset_registry& registry, part_tree& tree)
        : config_(&config), registry_(&registry), words_(registry), tree_(&tree)
    {
    }

    tree_builder(const tree_builder&) = delete;

    tree_builder& operator=(const tree_builder&) = delete;

    /**
    Building the root from the top level header and everything which follows it.
    **/
    result_void build_root(byte_source& input)
    {
        line_reader reader(input);
        auto header = read_header(reader);
        if (!header)
            return make_unexpected(std::move(header.error()));

        auto ctype = parse_media_type(header->get(CONTENT_TYPE_HEADER));
        if (!ctype)
            return make_unexpected(std::move(ctype.error()));

        const part_id root = tree_->append(std::nullopt, std::nullopt, ctype->value);
        tree_->mutable_node(root).header = std::move(*header);
        resolve_file_name(root, *ctype);

        if (ctype->is_multipart())
        {
            const std::string boundary = ctype->param(media_type_t::ATTR_BOUNDARY);
            if (boundary.empty())
            {
                error_detail det;
                det.add("content_type", ctype->value);
                return fail_void(errc::media_type_parse_error, "Missing boundary parameter of a multipart type.", det.str());
            }
            return build_children(root, reader, boundary);
        }
        return decode_leaf(root, *ctype, reader);
    }

private:

    /**
    Appending to `parent` one child per part delimited by `boundary` in `body`.
    **/
    result_void build_children(part_id parent, byte_source& body, const std::string& boundary)
    {
        const std::size_t depth = tree_->node(parent).depth;
        if (depth > config_->max_depth)
        {
            error_detail det;
            det.add("boundary", boundary);
            det.add_int("depth", depth);
            det.add_int("max_depth", config_->max_depth);
            return fail_void(errc::nesting_too_deep, "Multipart nesting exceeds the configured maximum.", det.str());
        }
        MIMETREE_TRACE_PART(depth, boundary, tree_->node(parent).content_type);

        multipart_reader splitter(body, boundary);
        std::optional<part_id> prev_sibling;
        while (true)
        {
            auto next = splitter.next();
            if (!next)
                return make_unexpected(std::move(next.error()));
            if (!next->has_value())
                return ok();

            raw_part& raw = **next;
            if (raw.header.empty())
            {
                // A delimiter not followed by anything is read as an empty part; accepted only as the last one.
                auto after = splitter.next();
                if ((after && !after->has_value()) || (!after && after.error().is(errc::unexpected_eof)))
                {
                    MIMETREE_WARN(std::format("Missing closing delimiter for boundary `{}`.", boundary));
                    return ok();
                }
                error_detail det;
                det.add("boundary", boundary);
                if (!after)
                    det.add_nested("cause.", after.error().to_string());
                return fail_void(errc::empty_header, std::format("Empty header at boundary `{}`.", boundary), det.str());
            }

            if (config_->repair_content_type_params)
                repair_content_type(raw.header);

            const std::string ctype_text = raw.header.get(CONTENT_TYPE_HEADER);
            if (trim_view(ctype_text).empty())
            {
                error_detail det;
                det.add("boundary", boundary);
                return fail_void(errc::missing_content_type, std::format("Missing Content-Type at boundary `{}`.", boundary),
                    det.str());
            }
            auto ctype = parse_media_type(ctype_text);
            if (!ctype)
            {
                MIMETREE_DEBUG(std::format("Bad Content-Type at boundary `{}`: {}", boundary, ctype.error().message));
                return make_unexpected(std::move(ctype.error()));
            }

            const part_id child = tree_->append(parent, prev_sibling, ctype->value);
            prev_sibling = child;
            tree_->mutable_node(child).header = std::move(raw.header);
            resolve_file_name(child, *ctype);

            string_source raw_body = raw.source();
            const std::string nested = ctype->param(media_type_t::ATTR_BOUNDARY);
            auto built = nested.empty() ? decode_leaf(child, *ctype, raw_body) : build_children(child, raw_body, nested);
            if (!built)
                return built;
        }
    }

    result_void decode_leaf(part_id id, const media_type_t& ctype, byte_source& body)
    {
        const header_map& header = tree_->node(id).header;
        std::string charset = ctype.param(media_type_t::ATTR_CHARSET);
        if (charset.empty())
            charset = header.get(CHARSET_HEADER);

        auto content = decode_section(header.get(CONTENT_TRANSFER_ENCODING_HEADER), charset, body, *registry_);
        if (!content)
        {
            MIMETREE_DEBUG(std::format("Decoding of a `{}` part failed: {}", ctype.value, content.error().message));
            return make_unexpected(std::move(content.error()));
        }
        tree_->mutable_node(id).content = std::move(*content);
        return ok();
    }

    /**
    Disposition and file name of a part. The disposition `filename` wins over the content type `name`.
    **/
    void resolve_file_name(part_id id, const media_type_t& ctype)
    {
        part_node& node = tree_->mutable_node(id);
        const std::string disp_text = node.header.get(CONTENT_DISPOSITION_HEADER);
        if (!disp_text.empty())
        {
            auto disp = parse_media_type(disp_text);
            if (disp)
            {
                node.disposition = disp->value;
                node.file_name = words_.decode_words(disp->param(media_type_t::ATTR_FILENAME));
            }
            else
                MIMETREE_DEBUG(std::format("Ignoring Content-Disposition `{}`: {}", disp_text, disp.error().message));
        }

        if (node.file_name.empty())
        {
            const std::string name = ctype.param(media_type_t::ATTR_NAME);
            if (!name.empty())
                node.file_name = words_.decode_words(name);
        }
    }

    /**
    Inserting the `name=value` segments of the Content-Type value as header fields.
    **/
    static void repair_content_type(header_map& header)
    {
        const std::string ctype = header.get(CONTENT_TYPE_HEADER);
        static constexpr std::string_view SEPARATOR{"; "};
        std::size_t pos = ctype.find(SEPARATOR);
        while (pos != std::string::npos)
        {
            const std::size_t start = pos + SEPARATOR.size();
            pos = ctype.find(SEPARATOR, start);
            const std::string_view segment = std::string_view(ctype).substr(start, pos == std::string::npos ? std::string::npos : pos - start);

            const auto eq = segment.find('=');
            if (eq == std::string_view::npos)
                continue;
            const std::string_view name = trim_view(segment.substr(0, eq));
            std::string_view value = trim_view(segment.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                value = value.substr(1, value.size() - 2);
            if (!is_valid_header_name(name) || iequals_ascii(name, CONTENT_TYPE_HEADER))
                continue;
            header.set(std::string(name), std::string(value));
        }
    }

    const parser_config* config_;
    const charset_registry* registry_;
    q_codec words_;
    part_tree* tree_;
};

} // namespace detail


/**
MIME document parser.

A parser holds only its configuration and can be used for any number of documents, also from several threads at once.
**/
class MIMETREE_EXPORT parser
{
public:

    explicit parser(parser_config config = {}) : config_(std::move(config))
    {
        if (!config_.registry)
            config_.registry = default_charset_registry();
    }

    /**
    Parsing a MIME document into a tree of parts.

    @param input Source positioned at the start of the header.
    @return      Tree whose root is the whole document.
    @error       `errc::header_parse_error` Malformed header block.
    @error       `errc::media_type_parse_error` Missing or malformed Content-Type, or multipart type without boundary.
    @error       `errc::missing_content_type` Part without Content-Type.
    @error       `errc::empty_header` Part without header which is not the last one.
    @error       `errc::boundary_error` No delimiter found for a boundary.
    @error       `errc::unexpected_eof` Input ended inside a part.
    @error       `errc::nesting_too_deep` More nested multipart levels than allowed.
    @error       `errc::unsupported_charset` Charset unknown to the registry.
    @error       `errc::io_error` Read failure of the input.
    **/
    [[nodiscard]] result<part_tree> parse(byte_source& input) const
    {
        part_tree tree;
        detail::tree_builder builder(config_, *config_.registry, tree);
        auto built = builder.build_root(input);
        if (!built)
        {
            MIMETREE_DEBUG(std::format("Parse aborted: {}", built.error().to_string()));
            return detail::make_unexpected(std::move(built.error()));
        }
        return tree;
    }

    [[nodiscard]] result<part_tree> parse(std::istream& input) const
    {
        istream_source source(input);
        return parse(source);
    }

    [[nodiscard]] result<part_tree> parse(std::string_view input) const
    {
        string_source source(input);
        return parse(source);
    }

    [[nodiscard]] const parser_config& config() const noexcept
    {
        return config_;
    }

private:

    parser_config config_;
};


/**
Parsing a MIME document with the default configuration.
**/
[[nodiscard]] inline result<part_tree> parse_mime(std::string_view input)
{
    return parser().parse(input);
}


} // namespace mimetree
