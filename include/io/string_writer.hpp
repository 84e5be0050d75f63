#pragma once

#include "io/io.hpp"

#include <string>

namespace lsmux {

class StringWriter final : public IWriter {
  public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        data_.append(reinterpret_cast<const char*>(in.data()), in.size());
        return Result::Ok();
    }
    Result Flush() override { return Result::Ok(); }

    const std::string& Data() const { return data_; }
    std::string Take() { return std::move(data_); }

  private:
    std::string data_;
};

} // namespace lsmux
