#include "cronrunner/util/base64.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iterator>
#include <vector>

namespace cronrunner {

auto base64_decode(std::string_view encoded) -> Result<std::string> {
  std::string input;
  input.reserve(encoded.size());
  std::copy_if(encoded.begin(), encoded.end(), std::back_inserter(input),
               [](char c) { return c != '\r' && c != '\n'; });

  if (input.empty()) {
    return std::string{};
  }
  if (input.size() % 4 != 0) {
    return fail(Error::DecodeError);
  }

  std::vector<unsigned char> out(input.size() / 4 * 3);
  int n = EVP_DecodeBlock(out.data(),
                          reinterpret_cast<const unsigned char*>(input.data()),
                          static_cast<int>(input.size()));
  if (n < 0) {
    return fail(Error::DecodeError);
  }

  // EVP_DecodeBlock counts padding bytes as zero output bytes
  std::size_t padding = 0;
  if (input.back() == '=') {
    ++padding;
    if (input[input.size() - 2] == '=') {
      ++padding;
    }
  }
  if (padding > static_cast<std::size_t>(n)) {
    return fail(Error::DecodeError);
  }

  return std::string(reinterpret_cast<const char*>(out.data()),
                     static_cast<std::size_t>(n) - padding);
}

}  // namespace cronrunner
