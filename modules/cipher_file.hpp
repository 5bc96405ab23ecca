#ifndef CIPHER_FILE_HPP
#define CIPHER_FILE_HPP

#include <gmpxx.h>
#include <cstddef>
#include <string>
#include <vector>

#include "rsa.hpp"

// 加密檔的內容
struct EncryptedMessage {
  std::size_t message_length = 0;
  RSAKey public_key;
  std::size_t block_size = kDefaultBlockSize;
  std::vector<mpz_class> blocks;
};

// 加密後寫檔，格式（純文字）：
//   message_length: <int>
//   public_key_used: (n, e)
//   key_size: <int>          <- 只有金鑰有宣告位元數時才有
//   block_size: <int>
//   <空行>
//   message: 
//   <每行一個密文整數>
// 無法開檔丟 std::runtime_error
void write_encrypted_file(const std::string& path, const std::string& message,
                          const RSAKey& public_key,
                          std::size_t block_size = kDefaultBlockSize);

// 讀回上面的格式；開檔失敗或格式錯誤丟 std::runtime_error
EncryptedMessage read_encrypted_file(const std::string& path);

// 金鑰檔：n、exponent、(key_size) 各一行
bool save_key(const std::string& path, const RSAKey& key);

// 讀 2 或 3 個十進位數字；讀不到或格式錯誤回傳 false，key 不變
bool load_key(const std::string& path, RSAKey& key);

#endif
