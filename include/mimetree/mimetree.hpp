#pragma once

#include <mimetree/config.hpp>
#include <mimetree/export.hpp>

#include <mimetree/detail/log.hpp>
#include <mimetree/detail/result.hpp>

#include <mimetree/io/byte_source.hpp>
#include <mimetree/io/line_reader.hpp>

#include <mimetree/codec/base64.hpp>
#include <mimetree/codec/base64_cleaner.hpp>
#include <mimetree/codec/codec.hpp>
#include <mimetree/codec/q_codec.hpp>
#include <mimetree/codec/quoted_printable.hpp>

#include <mimetree/charset/charset_registry.hpp>

#include <mimetree/mime/decoder.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/mime/header_reader.hpp>
#include <mimetree/mime/media_type.hpp>
#include <mimetree/mime/multipart_reader.hpp>
#include <mimetree/mime/parser.hpp>
#include <mimetree/mime/parser_config.hpp>
#include <mimetree/mime/part.hpp>
