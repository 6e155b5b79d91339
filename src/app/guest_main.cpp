#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "core/binder/integrity_binder.hpp"
#include "core/model/app_meta.hpp"
#include "core/proof/proof_builder.hpp"

namespace {

bool read_input_file(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  out = contents.str();
  return true;
}

// The guest contract has no recovery path: any failure ends the invocation.
[[noreturn]] void abort_invocation(const seal::Result& result) {
  std::cerr << "guest aborted [" << seal::error_kind_name(result.kind) << "]: " << result.message
            << '\n';
  std::abort();
}

void print_slots(const seal::GuestSlots& slots, std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    std::cout << "slot[" << i << "]=" << slots[i] << '\n';
  }
}

int usage() {
  std::cerr << "usage: score_seal_guest <input-file> [--extended]\n"
            << "       score_seal_guest --submission <input-file>\n";
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    return usage();
  }

  const std::string_view first{argv[1]};
  const bool submission = first == "--submission";
  bool extended = false;
  std::string path;
  if (submission) {
    if (argc != 3) {
      return usage();
    }
    path = argv[2];
  } else {
    path = argv[1];
    if (argc == 3) {
      if (std::string_view{argv[2]} != "--extended") {
        return usage();
      }
      extended = true;
    }
  }

  std::string bytes;
  if (!read_input_file(path, bytes)) {
    std::cerr << "Unable to read input file: " << path << '\n';
    return 1;
  }

  std::cout << seal::kAppDisplayName << " guest " << seal::kAppVersion << '\n';

  seal::GuestSlots slots{};
  if (submission) {
    const seal::Result sealed = seal::seal_submission_input(bytes, slots, nullptr);
    if (!sealed.ok) {
      abort_invocation(sealed);
    }
    print_slots(slots, seal::kGuestSlotCount);
    return 0;
  }

  seal::BindingOutput output;
  const seal::Result bound = seal::bind_guest_input(bytes, output);
  if (!bound.ok) {
    abort_invocation(bound);
  }
  slots = seal::guest_output_slots(output, extended);
  print_slots(slots, extended ? seal::kGuestSlotCount : 5U);
  return 0;
}
