#include "codec.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

std::string strip_trailing_nul(std::string s) {
  std::size_t end = s.find_last_not_of('\0');
  s.erase(end == std::string::npos ? 0 : end + 1);
  return s;
}

void check_block_size(std::size_t block_size) {
  if (block_size == 0) throw std::invalid_argument("block size must be > 0.");
}

}  // namespace

std::vector<mpz_class> text_to_blocks(const std::string& message,
                                      std::size_t block_size) {
  check_block_size(block_size);
  const std::string msg = strip_trailing_nul(message);

  for (std::size_t i = 0; i < msg.size(); ++i) {
    if (static_cast<unsigned char>(msg[i]) > 127) {
      throw std::invalid_argument("non-ASCII character at position " +
                                  std::to_string(i) + ".");
    }
  }

  std::vector<mpz_class> blocks;
  blocks.reserve((msg.size() + block_size - 1) / block_size);
  for (std::size_t start = 0; start < msg.size(); start += block_size) {
    std::size_t count = std::min(block_size, msg.size() - start);
    mpz_class value;
    // order = -1：第一個 byte 是最低位（little-endian）
    mpz_import(value.get_mpz_t(), count, -1, 1, 0, 0, msg.data() + start);
    blocks.push_back(value);
  }
  return blocks;
}

std::string blocks_to_text(const std::vector<mpz_class>& blocks,
                           std::size_t block_size) {
  check_block_size(block_size);

  std::string msg;
  msg.reserve(blocks.size() * block_size);
  std::string window;
  for (const mpz_class& block : blocks) {
    if (block < 0) throw std::invalid_argument("block must be non-negative.");
    // base 256 是 2 的冪次，mpz_sizeinbase 的結果是精確的
    if (block != 0 && mpz_sizeinbase(block.get_mpz_t(), 256) > block_size) {
      throw std::invalid_argument("block does not fit in " +
                                  std::to_string(block_size) + " bytes.");
    }

    window.assign(block_size, '\0');
    std::size_t written = 0;
    mpz_export(&window[0], &written, -1, 1, 0, 0, block.get_mpz_t());
    msg += window;
  }
  return strip_trailing_nul(msg);
}
