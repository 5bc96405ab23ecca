#ifndef CODEC_HPP
#define CODEC_HPP

#include <gmpxx.h>
#include <cstddef>
#include <string>
#include <vector>

#include "config.hpp"

// 把 ASCII 訊息切成 block_size 個 byte 一組，每組轉成一個整數：
//   C0 * 256^0 + C1 * 256^1 + ... + Ck * 256^k
// 最後一組不補零，區塊數 = ceil(len / block_size)。
// 注意：結尾的 '\0' 會先被去掉，所以以 '\0' 結尾的訊息無法還原。
// 非 ASCII 字元（> 127）或 block_size == 0 丟 std::invalid_argument
std::vector<mpz_class> text_to_blocks(const std::string& message,
                                      std::size_t block_size = kDefaultBlockSize);

// 反過來：每個區塊還原成 block_size 個 byte，串起來後去掉結尾的 '\0'
// 區塊為負或 >= 256^block_size 丟 std::invalid_argument
std::string blocks_to_text(const std::vector<mpz_class>& blocks,
                           std::size_t block_size = kDefaultBlockSize);

#endif
