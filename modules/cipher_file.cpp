#include "cipher_file.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

// 讀一行 "<label>: <value>"，回傳 value（去掉前後空白）
bool read_field(std::istream& in, const std::string& label, std::string& value) {
  std::string line;
  if (!std::getline(in, line)) return false;
  const std::string prefix = label + ":";
  if (line.compare(0, prefix.size(), prefix) != 0) return false;
  value = line.substr(prefix.size());
  std::size_t first = value.find_first_not_of(" \t\r");
  std::size_t last = value.find_last_not_of(" \t\r");
  value = first == std::string::npos ? "" : value.substr(first, last - first + 1);
  return true;
}

std::size_t parse_size(const std::string& text, const std::string& label) {
  try {
    std::size_t pos = 0;
    unsigned long long v = std::stoull(text, &pos);
    if (pos != text.size()) throw std::invalid_argument(text);
    return static_cast<std::size_t>(v);
  } catch (const std::exception&) {
    throw std::runtime_error("bad " + label + " value: '" + text + "'");
  }
}

mpz_class parse_integer(const std::string& text) {
  mpz_class v;
  if (text.empty() || v.set_str(text, 10) != 0) {
    throw std::runtime_error("bad integer: '" + text + "'");
  }
  return v;
}

// "(n, e)" -> n, e
void parse_key_tuple(const std::string& text, RSAKey& key) {
  if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
    throw std::runtime_error("bad public_key_used value: '" + text + "'");
  }
  std::string inner = text.substr(1, text.size() - 2);
  std::size_t comma = inner.find(',');
  if (comma == std::string::npos) {
    throw std::runtime_error("bad public_key_used value: '" + text + "'");
  }
  std::istringstream n_in(inner.substr(0, comma));
  std::istringstream e_in(inner.substr(comma + 1));
  std::string n_str, e_str;
  n_in >> n_str;
  e_in >> e_str;
  key.n = parse_integer(n_str);
  key.exponent = parse_integer(e_str);
}

}  // namespace

void write_encrypted_file(const std::string& path, const std::string& message,
                          const RSAKey& public_key, std::size_t block_size) {
  std::vector<mpz_class> data = rsa_encrypt(message, public_key, block_size);

  std::ofstream fout(path);
  if (!fout) throw std::runtime_error("cannot open " + path + " for writing.");

  RSAKey shown = public_key;
  shown.key_size.reset();  // key_size 另外一行
  fout << "message_length: " << message.size() << "\n";
  fout << "public_key_used: " << format_key(shown) << "\n";
  if (public_key.key_size) fout << "key_size: " << *public_key.key_size << "\n";
  fout << "block_size: " << block_size << "\n";
  fout << "\n";
  fout << "message: \n";
  for (std::size_t i = 0; i < data.size(); ++i) {
    if (i != 0) fout << "\n";
    fout << data[i];
  }

  if (!fout) throw std::runtime_error("failed writing " + path + ".");
}

EncryptedMessage read_encrypted_file(const std::string& path) {
  std::ifstream fin(path);
  if (!fin) throw std::runtime_error("cannot open " + path + ".");

  EncryptedMessage out;
  std::string value;

  if (!read_field(fin, "message_length", value)) {
    throw std::runtime_error(path + ": missing message_length.");
  }
  out.message_length = parse_size(value, "message_length");

  if (!read_field(fin, "public_key_used", value)) {
    throw std::runtime_error(path + ": missing public_key_used.");
  }
  parse_key_tuple(value, out.public_key);

  // key_size 是選填的
  std::streampos mark = fin.tellg();
  if (read_field(fin, "key_size", value)) {
    out.public_key.key_size = parse_size(value, "key_size");
  } else {
    fin.clear();
    fin.seekg(mark);
  }

  if (!read_field(fin, "block_size", value)) {
    throw std::runtime_error(path + ": missing block_size.");
  }
  out.block_size = parse_size(value, "block_size");

  std::string blank;
  if (!std::getline(fin, blank) || !read_field(fin, "message", value)) {
    throw std::runtime_error(path + ": missing message section.");
  }

  std::string line;
  while (std::getline(fin, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    out.blocks.push_back(parse_integer(line));
  }
  return out;
}

bool save_key(const std::string& path, const RSAKey& key) {
  std::ofstream fout(path);
  if (!fout) return false;
  fout << key.n << "\n";
  fout << key.exponent << "\n";
  if (key.key_size) fout << *key.key_size << "\n";
  return static_cast<bool>(fout);
}

bool load_key(const std::string& path, RSAKey& key) {
  std::ifstream fin(path);
  if (!fin) return false;

  RSAKey loaded;
  fin >> loaded.n >> loaded.exponent;
  if (fin.fail()) return false;

  std::size_t bits = 0;
  if (fin >> bits) {
    loaded.key_size = bits;
  } else if (!fin.eof()) {
    return false;
  }

  key = loaded;
  return true;
}
