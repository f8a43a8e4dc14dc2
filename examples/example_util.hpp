#pragma once

#include <iostream>
#include <mimetree/detail/result.hpp>

inline void print_error(const mimetree::error_info& err)
{
    std::cerr << "Error: " << mimetree::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        std::cerr << "Detail: " << err.detail;
    if (err.sys)
        std::cerr << "Sys: " << err.sys.message() << "\n";
    std::cerr << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}
