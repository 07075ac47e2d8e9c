// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Replays corpus files through a fuzz target when libFuzzer is unavailable

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char **argv) {
  if (argc < 2) {
    std::fprintf(stderr, "Usage: %s <input_file>...\n", argv[0]);
    return 1;
  }

  for (int i = 1; i < argc; ++i) {
    std::ifstream file(argv[i], std::ios::binary);
    if (!file) {
      std::fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
      return 1;
    }
    std::vector<uint8_t> input((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    LLVMFuzzerTestOneInput(input.data(), input.size());
    std::printf("%s: %zu bytes ok\n", argv[i], input.size());
  }
  return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
