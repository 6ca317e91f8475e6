#include <algorithm>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <canopy/core/exclusion.hpp>
#include <canopy/core/hash.hpp>
#include <canopy/core/merkle.hpp>
#include <canopy/core/proof.hpp>
#include <canopy/core/tree.hpp>

using namespace canopy::core;

static void print_usage() {
  std::printf(
    "Canopy Merkle CLI\n\n"
    "Usage:\n"
    "  canopy root    --leaves CSV [--hex]\n"
    "  canopy prove   --leaves CSV (--index N | --leaf S) [--capacity N] [--hex]\n"
    "  canopy verify  --leaf S --proof HEX --root HEX [--hex]\n"
    "  canopy exclude --leaves CSV --target S [--hex]\n\n"
    "Options:\n"
    "  --leaves    CSV of leaves (default: a,b,c,d,e)\n"
    "  --index     Leaf index to prove\n"
    "  --leaf      Leaf value to prove or verify\n"
    "  --capacity  Maximum proof length (default: unbounded)\n"
    "  --proof     Serialized proof as printed by 'prove'\n"
    "  --root      Expected root (64 hex chars)\n"
    "  --target    Value to prove absent\n"
    "  --hex       Leaf values are 32-byte hex hashes instead of strings hashed with SHA-256\n"
  );
}

struct CliOptions {
  std::string leaves_csv = "a,b,c,d,e";
  std::optional<size_t> index;
  std::optional<std::string> leaf;
  std::optional<std::string> target;
  std::string proof_hex;
  std::string root_hex;
  ProofOptions proof_options;
  bool hex_leaves = false;
  bool help = false;
};

// Returns false on an unknown option.
static bool parse_options(int argc, char** argv, CliOptions& options) {
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    auto take = [&](const std::string& name) {
      if (arg.rfind(name + "=", 0) == 0) { value = arg.substr(name.size() + 1); return true; }
      if (arg == name && i + 1 < argc) { value = argv[++i]; return true; }
      return false;
    };

    if (take("--leaves")) {
      options.leaves_csv = value;
    } else if (take("--index")) {
      options.index = static_cast<size_t>(std::stoull(value));
    } else if (take("--leaf")) {
      options.leaf = value;
    } else if (take("--capacity")) {
      options.proof_options.capacity = static_cast<size_t>(std::stoull(value));
    } else if (take("--proof")) {
      options.proof_hex = value;
    } else if (take("--root")) {
      options.root_hex = value;
    } else if (take("--target")) {
      options.target = value;
    } else if (arg == "--hex") {
      options.hex_leaves = true;
    } else if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      return false;
    }
  }
  return true;
}

static Hash leaf_hash(const std::string& value, bool hex_leaves) {
  return hex_leaves ? hash_from_hex(value) : sha256(value);
}

static std::vector<Hash> parse_leaves(const CliOptions& options) {
  std::vector<std::string> parts;
  {
    std::string cur;
    for (char c : options.leaves_csv) {
      if (c == ',') { parts.push_back(cur); cur.clear(); }
      else { cur.push_back(c); }
    }
    parts.push_back(cur);
  }
  std::vector<Hash> leaves;
  leaves.reserve(parts.size());
  for (const auto& s : parts) leaves.push_back(leaf_hash(s, options.hex_leaves));
  return leaves;
}

static int cmd_root(const CliOptions& options) {
  auto leaves = parse_leaves(options);
  auto R = merkle_root(leaves, sha256_pair);
  std::cout << "leaves: " << leaves.size() << "\n";
  std::cout << "height: " << tree_height(leaves.size()) << "\n";
  std::cout << "root:   " << to_hex(R) << "\n";
  return 0;
}

static int cmd_prove(const CliOptions& options) {
  MerkleTree tree(parse_leaves(options), sha256_pair);
  Proof proof;
  if (options.index) {
    proof = tree.make_proof_at(*options.index, options.proof_options);
  } else if (options.leaf) {
    proof = tree.make_proof(leaf_hash(*options.leaf, options.hex_leaves), options.proof_options);
  } else {
    std::fprintf(stderr, "prove: one of --index or --leaf is required\n");
    return 1;
  }

  std::cout << "root:  " << to_hex(tree.root()) << "\n";
  std::cout << "proof.len: " << proof.len() << "\n";
  for (size_t i = 0; i < proof.len(); ++i) {
    const auto& node = proof.at(i);
    std::cout << "  [" << i << "] " << (node.side == Side::Right ? "R " : "L ") << to_hex(node.data) << "\n";
  }
  std::cout << "proof: " << to_hex(proof.serialize()) << "\n";
  return 0;
}

static int cmd_verify(const CliOptions& options) {
  if (!options.leaf || options.proof_hex.empty() || options.root_hex.empty()) {
    std::fprintf(stderr, "verify: --leaf, --proof and --root are required\n");
    return 1;
  }
  auto proof = Proof::deserialize(from_hex(options.proof_hex));
  auto expected_root = hash_from_hex(options.root_hex);
  auto leaf = leaf_hash(*options.leaf, options.hex_leaves);

  auto computed = merkle_proof_check(proof, leaf, sha256_pair);
  bool ok = computed == expected_root;
  std::cout << "computed: " << to_hex(computed) << "\n";
  std::cout << "verify: " << (ok ? "OK" : "FAIL") << "\n";
  return ok ? 0 : 2;
}

static int cmd_exclude(const CliOptions& options) {
  if (!options.target) {
    std::fprintf(stderr, "exclude: --target is required\n");
    return 1;
  }
  auto leaves = parse_leaves(options);
  std::sort(leaves.begin(), leaves.end());
  leaves.erase(std::unique(leaves.begin(), leaves.end()), leaves.end());

  MerkleTree tree(leaves, sha256_pair);
  auto target = leaf_hash(*options.target, options.hex_leaves);
  auto proof = make_exclusion_proof(tree, target, options.proof_options);

  std::cout << "root:   " << to_hex(tree.root()) << "\n";
  std::cout << "target: " << to_hex(target) << "\n";
  if (proof.left) std::cout << "left:   [" << proof.left->index << "] " << to_hex(proof.left->leaf) << "\n";
  if (proof.right) std::cout << "right:  [" << proof.right->index << "] " << to_hex(proof.right->leaf) << "\n";
  bool ok = verify_exclusion_proof(target, proof, tree.root(), sha256_pair, tree.leaf_count());
  std::cout << "exclusion: " << (ok ? "OK" : "FAIL") << "\n";
  return ok ? 0 : 2;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 0;
  }

  const std::string command = argv[1];
  CliOptions options;
  try {
    if (!parse_options(argc, argv, options)) {
      print_usage();
      return 1;
    }
    if (options.help) {
      print_usage();
      return 0;
    }

    if (command == "root") return cmd_root(options);
    if (command == "prove") return cmd_prove(options);
    if (command == "verify") return cmd_verify(options);
    if (command == "exclude") return cmd_exclude(options);
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }

  std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
  print_usage();
  return 1;
}
