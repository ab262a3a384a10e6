#pragma once

#ifdef __cplusplus

#include <string>
#include <string_view>

namespace docmap {
namespace inflector {

/// English plural of `word`. Uncountable words are returned unchanged and the
/// case of the first letter is preserved ("Person" -> "People").
std::string pluralize(std::string_view word);

} // namespace inflector
} // namespace docmap

#endif // __cplusplus
