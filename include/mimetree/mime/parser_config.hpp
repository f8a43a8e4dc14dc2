/*

parser_config.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <memory>

#include <mimetree/charset/charset_registry.hpp>
#include <mimetree/config.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Options of the MIME parser.
**/
struct MIMETREE_EXPORT parser_config
{
    /**
    Maximum number of nested multipart levels below the root.
    **/
    std::size_t max_depth = MIMETREE_DEFAULT_MAX_DEPTH;

    /**
    Re-adding `Content-Type` parameters as header fields, for splitters which separate them.
    **/
    bool repair_content_type_params = true;

    /**
    Charset lookup used for bodies and encoded words; the default registry when null.
    **/
    std::shared_ptr<const charset_registry> registry;

    static parser_config strict()
    {
        parser_config cfg;
        cfg.max_depth = 16;
        cfg.repair_content_type_params = false;
        return cfg;
    }

    static parser_config lenient()
    {
        parser_config cfg;
        cfg.max_depth = 64;
        cfg.repair_content_type_params = true;
        return cfg;
    }
};


} // namespace mimetree
