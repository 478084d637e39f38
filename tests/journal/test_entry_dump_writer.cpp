#include "journal/entry_dump_writer.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

fs::path freshFolder(const std::string &name) {
  fs::path folder = fs::temp_directory_path() / name;
  fs::remove_all(folder);
  return folder;
}

std::string readAll(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

void testDisabledWriter() {
  std::cout << "Testing EntryDumpWriter - disabled...\n";
  EntryDumpWriter writer("");
  assert(!writer.isEnabled());
  assert(!writer.dump({1, 2, 3}, 0, "header"));
  std::cout << "✓ disabled writer test passed\n";
}

void testDumpsTailAndDescription() {
  std::cout << "Testing EntryDumpWriter - dump contents...\n";
  fs::path folder = freshFolder("entry_dump_writer_contents");
  EntryDumpWriter writer(folder.string());
  assert(writer.isEnabled());

  std::vector<uint8_t> data = {0x10, 0x20, 0x30, 0x40, 0x50};
  auto path = writer.dump(data, 2, "EntryHeader [sequenceNumber=42]");
  assert(path && fs::exists(*path));
  assert(path->filename().string().size() > 12 &&
         path->filename().string().substr(path->filename().string().size() -
                                          2) == "-0");

  std::string binary = readAll(*path);
  assert(binary == std::string("\x30\x40\x50") &&
         "Only the bytes from the entry offset are dumped");

  fs::path textPath = *path;
  textPath += ".txt";
  std::string text = readAll(textPath);
  assert(text.find("EntryHeader [sequenceNumber=42]") != std::string::npos);
  assert(text.find("dumped: 3") != std::string::npos);
  assert(text.find("total length: 5") != std::string::npos);

  fs::remove_all(folder);
  std::cout << "✓ dump contents test passed\n";
}

void testNeverOverwrites() {
  std::cout << "Testing EntryDumpWriter - unique names...\n";
  fs::path folder = freshFolder("entry_dump_writer_unique");
  EntryDumpWriter writer(folder.string());

  auto first = writer.dump({1}, 0, "first");
  auto second = writer.dump({2}, 0, "second");
  assert(first && second);
  if (first->parent_path() == second->parent_path() &&
      first->filename().string().substr(0, 11) ==
          second->filename().string().substr(0, 11)) {
    assert(*first != *second && "Same minute dumps get distinct names");
  }
  assert(readAll(*first) == std::string("\x01"));
  assert(readAll(*second) == std::string("\x02"));

  fs::remove_all(folder);
  std::cout << "✓ unique names test passed\n";
}

void testUnwritableFolder() {
  std::cout << "Testing EntryDumpWriter - unwritable folder...\n";
  fs::path blocker = freshFolder("entry_dump_writer_blocker");
  {
    std::ofstream file(blocker);
    file << "not a directory";
  }
  EntryDumpWriter writer((blocker / "dumps").string());
  assert(!writer.dump({1, 2}, 0, "header") && "Failure is reported, not thrown");
  fs::remove_all(blocker);
  std::cout << "✓ unwritable folder test passed\n";
}

int main() {
  try {
    testDisabledWriter();
    testDumpsTailAndDescription();
    testNeverOverwrites();
    testUnwritableFolder();
    std::cout << "\n✅ All EntryDumpWriter tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
