#include <iostream>
#include <string>
#include <algorithm>
#include <vector>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

// 引入 modules 資料夾下的標頭檔
#include "modules/config.hpp"
#include "modules/rsa.hpp"
#include "modules/keygen.hpp"
#include "modules/cipher_file.hpp"

using namespace std;
namespace fs = std::filesystem;

static RSAKey publicKey;
static RSAKey privateKey;
static bool hasPublic = false;
static bool hasPrivate = false;

// --- 輔助：確保 data 資料夾存在 ---
void initEnvironment() {
    if (!fs::exists(DATA_DIR)) {
        fs::create_directory(DATA_DIR);
        cout << "[系統] 已自動建立資料目錄: " << DATA_DIR << endl;
    }
}

// --- 輔助：暫停 ---
void waitEnter() {
    cout << "\n[按 Enter 鍵繼續...]";
    cin.get();
}

// --- 輔助：列出 data 資料夾下的檔案 ---
void listDataFiles() {
    cout << "\n--- " << DATA_DIR << " 目錄下的檔案 ---" << endl;
    int count = 0;
    if (fs::exists(DATA_DIR)) {
        for (const auto& entry : fs::directory_iterator(DATA_DIR)) {
            if (!entry.is_directory()) {
                cout << entry.path().filename().string() << "\t";
                if (++count % 3 == 0) cout << endl;
            }
        }
    }
    cout << "\n--------------------------" << endl;
}

// --- 輔助：讀一行，空白則回傳預設值 ---
string promptLine(const string& question, const string& fallback) {
    cout << question << " (預設 " << fallback << "): ";
    string answer;
    getline(cin, answer);
    return answer.empty() ? fallback : answer;
}

// --- 輔助：讀一個正整數，空白則回傳預設值 ---
size_t promptSize(const string& question, size_t fallback) {
    while (true) {
        string answer = promptLine(question, to_string(fallback));
        istringstream in(answer);
        size_t value = 0;
        if (in >> value && in.eof() && value > 0) return value;
        cout << "[錯誤] 請輸入正整數。" << endl;
    }
}

// --- 功能：生成金鑰並存成 <name>.pub / <name>.priv ---
void generateKeys() {
    string name = promptLine("\n[設定] 請輸入金鑰檔名", DEFAULT_KEY_NAME);
    size_t bits = promptSize("[設定] 每個質數的位元數", kDefaultKeyBits);

    cout << "\n[系統] 生成金鑰中 (p, q 各 " << bits << " bits)..." << endl;
    try {
        RSAKeyPair pair = rsa_keygen(bits);
        publicKey = pair.public_key;
        privateKey = pair.private_key;
        hasPublic = hasPrivate = true;

        string pubPath = DATA_DIR + name + ".pub";
        string privPath = DATA_DIR + name + ".priv";
        if (save_key(pubPath, publicKey) && save_key(privPath, privateKey)) {
            cout << "[系統] 公鑰已儲存至: " << pubPath << endl;
            cout << "[系統] 私鑰已儲存至: " << privPath << endl;
        } else {
            cerr << "[錯誤] 無法寫入金鑰檔案！" << endl;
        }
    } catch (const exception& e) {
        cerr << "[失敗] " << e.what() << endl;
    }
}

// --- 功能：載入金鑰（公鑰、私鑰擇一即可） ---
void loadKeys() {
    string name;
    cout << "\n--- 載入金鑰 ---" << endl;
    while (true) {
        cout << "請輸入金鑰檔名，不含副檔名 (輸入 ? 查詢 " << DATA_DIR << "): ";
        getline(cin, name);
        if (name == "?") { listDataFiles(); continue; }

        bool pub = load_key(DATA_DIR + name + ".pub", publicKey);
        bool priv = load_key(DATA_DIR + name + ".priv", privateKey);
        hasPublic = hasPublic || pub;
        hasPrivate = hasPrivate || priv;
        if (pub || priv) {
            cout << "\n[成功] 已載入" << (pub ? " 公鑰" : "") << (priv ? " 私鑰" : "") << endl;
            break;
        }
        cout << "[失敗] 找不到檔案或是格式錯誤，請重試。" << endl;
    }
}

// --- 輔助：依金鑰大小建議區塊大小（必須 256^block < n） ---
size_t suggestedBlockSize(const RSAKey& key) {
    size_t keyBits = key.key_size ? *key.key_size : mpz_sizeinbase(key.n.get_mpz_t(), 2);
    size_t fit = keyBits > 8 ? (keyBits - 1) / 8 : 1;
    return min(kDefaultBlockSize, fit);
}

// --- 功能：加密訊息並寫入檔案 ---
void encryptMessage() {
    cout << "\n--- 加密模式 ---" << endl;
    cout << "輸入要加密的訊息 (ASCII): ";
    string message;
    getline(cin, message);

    string outFile = promptLine("輸入加密後檔名", DEFAULT_CIPHER_FILE);
    size_t blockSize = promptSize("區塊大小 (bytes)", suggestedBlockSize(publicKey));

    try {
        write_encrypted_file(DATA_DIR + outFile, message, publicKey, blockSize);
        cout << "\n[成功] 加密完成！" << endl;
        cout << "   -> 檔案位於: " << DATA_DIR << outFile << endl;
    } catch (const exception& e) {
        cerr << "\n[錯誤] " << e.what() << endl;
    }
}

// --- 功能：讀取加密檔並解密 ---
void decryptMessage() {
    string encFile;
    cout << "\n--- 解密模式 ---" << endl;
    while (true) {
        encFile = promptLine("輸入加密檔名 (? 查詢)", DEFAULT_CIPHER_FILE);
        if (encFile == "?") { listDataFiles(); continue; }
        if (fs::exists(DATA_DIR + encFile)) break;
        cout << "[錯誤] 找不到 " << (DATA_DIR + encFile) << endl;
    }

    try {
        EncryptedMessage enc = read_encrypted_file(DATA_DIR + encFile);
        if (enc.public_key.n != privateKey.n) {
            cout << "[警告] 檔案使用的公鑰與目前私鑰的 n 不同，結果可能是亂碼。" << endl;
        }
        string plain = rsa_decrypt(enc.blocks, privateKey, enc.block_size);
        cout << "\n[成功] 解密完成！" << endl;
        cout << "   -> 訊息 (" << plain.size() << "/" << enc.message_length << " bytes): " << plain << endl;
    } catch (const exception& e) {
        cerr << "\n[錯誤] " << e.what() << endl;
    }
}

int main() {
    #ifdef _WIN32
        system("chcp 65001");
    #endif

    initEnvironment();

    while (true) {
        cout << "============================================" << endl;
        cout << "   RSA 區塊加密系統" << endl;
        cout << "============================================" << endl;
        cout << "資料存放位置: ./" << DATA_DIR << endl;
        cout << "公鑰狀態: " << (hasPublic ? "✅ 已載入" : "❌ 未載入") << endl;
        cout << "私鑰狀態: " << (hasPrivate ? "✅ 已載入" : "❌ 未載入") << endl;
        cout << "--------------------------------------------" << endl;
        cout << "1. 生成新 RSA 金鑰" << endl;
        cout << "2. 載入 RSA 金鑰 (手動選擇)" << endl;
        cout << "3. 加密訊息 (Sender)" << endl;
        cout << "4. 解密檔案 (Receiver)" << endl;
        cout << "5. 離開" << endl;
        cout << "============================================" << endl;
        cout << "請輸入選項: ";

        string choice;
        if (!getline(cin, choice)) break;

        if (choice == "1") {
            generateKeys();
            waitEnter();
        }
        else if (choice == "2") {
            loadKeys();
            waitEnter();
        }
        else if (choice == "3") {
            if (!hasPublic) { cout << "\n[警告] 請先執行選項 1 或 2 載入公鑰！" << endl; waitEnter(); continue; }
            encryptMessage();
            waitEnter();
        }
        else if (choice == "4") {
            if (!hasPrivate) { cout << "\n[警告] 無 RSA 私鑰！" << endl; waitEnter(); continue; }
            decryptMessage();
            waitEnter();
        }
        else if (choice == "5") break;
    }
    return 0;
}
