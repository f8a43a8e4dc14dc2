#pragma once

#include <string>
#include <string_view>

namespace mimetree
{
namespace detail
{

struct output_sink
{
    virtual ~output_sink() = default;
    virtual void write(std::string_view chunk) = 0;
};

class string_sink : public output_sink
{
public:
    explicit string_sink(std::string& out) : out_(&out) {}

    void write(std::string_view chunk) override
    {
        out_->append(chunk.data(), chunk.size());
    }

private:
    std::string* out_;
};

} // namespace detail
} // namespace mimetree
