/* @file LogRecord.cpp
 * @brief applies a record's stored args to its message template
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// fmt headers
#include <fmt/args.h>
#include <fmt/format.h>

// labsim headers
#include "core/LogRecord.hpp"

namespace labsim::core {

  std::string renderMessage(const LogRecord& record) {
    if (record.args.empty())
      return record.message;

    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& arg : record.args) {
      if (arg.is_string())
        store.push_back(arg.get<std::string>());
      else if (arg.is_boolean())
        store.push_back(arg.get<bool>());
      else if (arg.is_number_unsigned())
        store.push_back(arg.get<std::uint64_t>());
      else if (arg.is_number_integer())
        store.push_back(arg.get<std::int64_t>());
      else if (arg.is_number_float())
        store.push_back(arg.get<double>());
      else
        store.push_back(arg.dump()); // objects, arrays, null
    }
    return fmt::vformat(record.message, store);
  }

} // namespace labsim::core
