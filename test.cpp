#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <gmpxx.h>
#include <filesystem> // 用於建立 data 資料夾

#include "modules/config.hpp"
#include "modules/keygen.hpp"
#include "modules/rsa.hpp"
#include "modules/cipher_file.hpp"

namespace fs = std::filesystem;

namespace {

int failures = 0;

void check(bool ok, const std::string& name) {
    std::cout << (ok ? "         [OK]   " : "         [FAIL] ") << name << std::endl;
    if (!ok) ++failures;
}

// 輔助函式：讀取整個檔案
std::string read_all(const std::string& path) {
    std::ifstream fin(path);
    std::ostringstream buf;
    buf << fin.rdbuf();
    return buf.str();
}

void write_all(const std::string& path, const std::string& text) {
    std::ofstream fout(path);
    fout << text;
}

bool same_key(const RSAKey& a, const RSAKey& b) {
    return a.n == b.n && a.exponent == b.exponent && a.key_size == b.key_size;
}

}  // namespace

int main() {
    std::cout << "=== RSA 區塊加密整合測試 ===\n" << std::endl;

    // 0. 確保 data 資料夾存在
    if (!fs::exists(DATA_DIR)) {
        fs::create_directory(DATA_DIR);
        std::cout << "[系統] 自動建立 " << DATA_DIR << " 資料夾" << std::endl;
    }

    const std::string message = "This is a secret message for RSA block cipher testing.";
    const std::string cipherFile = DATA_DIR + "test_message.enc";
    const std::string pubFile = DATA_DIR + "test_key.pub";
    const std::string privFile = DATA_DIR + "test_key.priv";

    // ---------------------------------------------------------
    // 第一部分：金鑰產生與存檔
    // ---------------------------------------------------------
    std::cout << "[Step 1] 產生 RSA 金鑰對 (p, q 各 256 bits)..." << std::endl;
    RSAKeyPair pair = rsa_keygen(256);

    std::cout << "[Step 2] 儲存並重新載入金鑰..." << std::endl;
    check(save_key(pubFile, pair.public_key) && save_key(privFile, pair.private_key),
          "save_key writes both keys");
    RSAKey pub, priv;
    check(load_key(pubFile, pub) && same_key(pub, pair.public_key), "public key reloads");
    check(load_key(privFile, priv) && same_key(priv, pair.private_key), "private key reloads");
    check(read_all(pubFile) == pair.public_key.n.get_str() + "\n65537\n256\n",
          "key file holds n, e, key_size");

    RSAKey plainKey{mpz_class("5551201688147"), mpz_class(65537), std::nullopt};
    RSAKey loadedPlain;
    check(save_key(DATA_DIR + "test_plain.pub", plainKey) &&
              load_key(DATA_DIR + "test_plain.pub", loadedPlain) && same_key(loadedPlain, plainKey),
          "two-value key file loads without key_size");

    write_all(DATA_DIR + "test_bad.pub", "12345\nnot-a-number\n");
    RSAKey untouched = plainKey;
    check(!load_key(DATA_DIR + "test_bad.pub", untouched) && same_key(untouched, plainKey),
          "malformed key file is rejected and key is unchanged");
    check(!load_key(DATA_DIR + "no_such_file.pub", untouched), "missing key file is rejected");

    // ---------------------------------------------------------
    // 第二部分：加密寫檔
    // ---------------------------------------------------------
    std::cout << "[Step 3] 加密訊息並寫入 " << cipherFile << "..." << std::endl;
    write_encrypted_file(cipherFile, message, pub, 16);

    std::vector<mpz_class> blocks = rsa_encrypt(message, pub, 16);
    std::string expected = "message_length: " + std::to_string(message.size()) + "\n" +
                           "public_key_used: (" + pub.n.get_str() + ", 65537)\n" +
                           "key_size: 256\n" +
                           "block_size: 16\n" +
                           "\n" +
                           "message: \n";
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i != 0) expected += "\n";
        expected += blocks[i].get_str();
    }
    check(read_all(cipherFile) == expected, "encrypted file layout");

    // ---------------------------------------------------------
    // 第三部分：讀檔解密
    // ---------------------------------------------------------
    std::cout << "[Step 4] 讀取加密檔並用私鑰解密..." << std::endl;
    EncryptedMessage enc = read_encrypted_file(cipherFile);
    check(enc.message_length == message.size(), "message_length reads back");
    check(enc.block_size == 16, "block_size reads back");
    check(same_key(enc.public_key, pub), "public_key_used and key_size read back");
    check(enc.blocks == blocks, "cipher blocks read back");
    check(rsa_decrypt(enc.blocks, priv, enc.block_size) == message, "file decrypts to the message");

    std::cout << "[Step 5] 不帶 key_size 的金鑰..." << std::endl;
    const std::string plainFile = DATA_DIR + "test_plain.enc";
    write_encrypted_file(plainFile, "abcdefghijklmnopqrstuvwxyz", plainKey, 5);
    check(read_all(plainFile).find("key_size") == std::string::npos, "no key_size line for plain key");
    EncryptedMessage plainEnc = read_encrypted_file(plainFile);
    RSAKey samplePrivate{mpz_class("5551201688147"), mpz_class("109182490673"), std::nullopt};
    check(!plainEnc.public_key.key_size && plainEnc.blocks.size() == 6,
          "plain file reads back without key_size");
    check(rsa_decrypt(plainEnc.blocks, samplePrivate, plainEnc.block_size) == "abcdefghijklmnopqrstuvwxyz",
          "plain file decrypts with the sample private key");

    std::cout << "[Step 6] 錯誤處理..." << std::endl;
    write_all(DATA_DIR + "test_bad.enc", "message_length: 3\nblock_size: 16\n");
    bool badThrown = false;
    try {
        read_encrypted_file(DATA_DIR + "test_bad.enc");
    } catch (const std::runtime_error&) {
        badThrown = true;
    }
    check(badThrown, "file without public_key_used is rejected");

    bool missingThrown = false;
    try {
        read_encrypted_file(DATA_DIR + "no_such_file.enc");
    } catch (const std::runtime_error&) {
        missingThrown = true;
    }
    check(missingThrown, "missing encrypted file is rejected");

    bool sizeThrown = false;
    try {
        write_encrypted_file(DATA_DIR + "test_too_big.enc", message, pub, 32);
    } catch (const std::domain_error&) {
        sizeThrown = true;
    }
    check(sizeThrown, "block size too large for the key is rejected before writing");
    check(!fs::exists(DATA_DIR + "test_too_big.enc"), "nothing written on rejected block size");

    std::cout << std::endl;
    if (failures == 0) {
        std::cout << "============================================" << std::endl;
        std::cout << "   整合測試完全成功！" << std::endl;
        std::cout << "   測試產物皆存放於 " << DATA_DIR << " 資料夾中。" << std::endl;
        std::cout << "============================================" << std::endl;
        return 0;
    }
    std::cout << "============================================" << std::endl;
    std::cout << "   警告：" << failures << " 項檢查失敗。" << std::endl;
    std::cout << "============================================" << std::endl;
    return 1;
}
