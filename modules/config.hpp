#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <string>

// --- 演算法預設值 ---
inline constexpr std::size_t kDefaultBlockSize = 128;   // bytes
inline constexpr unsigned long kDefaultExponent = 65537;
inline constexpr int kMillerRabinRounds = 5;            // 誤判率 <= 4^-rounds
inline constexpr unsigned long kSmallPrimeLimit = 1000; // 篩法上限（不含）

// 產生金鑰時每個質數的位元數
inline constexpr std::size_t kDefaultKeyBits = 1024;

// --- 資料夾與檔名 ---
inline const std::string DATA_DIR = "data/";
inline const std::string DEFAULT_KEY_NAME = "rsa_key";  // -> rsa_key.pub / rsa_key.priv
inline const std::string DEFAULT_CIPHER_FILE = "message.enc";

#endif
