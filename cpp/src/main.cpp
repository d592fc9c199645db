#include "eccrypt/cli_colors.hpp"
#include "eccrypt/ec.hpp"
#include "eccrypt/ecdsa.hpp"
#include "eccrypt/ecies.hpp"
#include "eccrypt/env.hpp"
#include "eccrypt/error.hpp"
#include "eccrypt/hex.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitBadSignature = 3;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  eccrypt pubkey <privkey|->\n";
    std::cout << "  eccrypt encrypt <pubkey> <text> [--bytes-hex]\n";
    std::cout << "  eccrypt decrypt <privkey|-> --iv <hex> --ephemeral-pk <hex> --cipher-text <hex> --mac <hex> [--was-string]\n";
    std::cout << "  eccrypt sign <privkey|-> <text> [--bytes-hex]\n";
    std::cout << "  eccrypt verify <text> <pubkey> <signature> [--bytes-hex]\n";
    std::cout << "\n";
    std::cout << "A private key of \"-\" is read from $" << eccrypt::env::kPrivateKeyVar << ".\n";
    std::cout << "--bytes-hex treats <text> as hex-encoded raw bytes.\n";
}

struct Args {
    std::vector<std::string> positional;
    bool bytes_hex = false;
    bool was_string = false;
    eccrypt::ecies::CipherObject::Wire wire;
};

Args ParseArgs(int argc, char** argv, int start_index) {
    Args args;
    int idx = start_index;
    auto take_value = [&](const std::string& flag) {
        if (idx + 1 >= argc) {
            throw UsageError("Missing value for " + flag);
        }
        std::string value = argv[idx + 1];
        idx += 2;
        return value;
    };
    while (idx < argc) {
        std::string arg(argv[idx]);
        if (arg == "--bytes-hex") {
            args.bytes_hex = true;
            idx += 1;
        } else if (arg == "--was-string") {
            args.was_string = true;
            idx += 1;
        } else if (arg == "--no-color") {
            eccrypt::cli::SetColorsEnabled(false);
            idx += 1;
        } else if (arg == "--iv") {
            args.wire.iv = take_value(arg);
        } else if (arg == "--ephemeral-pk") {
            args.wire.ephemeral_pk = take_value(arg);
        } else if (arg == "--cipher-text") {
            args.wire.cipher_text = take_value(arg);
        } else if (arg == "--mac") {
            args.wire.mac = take_value(arg);
        } else if (arg.rfind("--", 0) == 0) {
            throw UsageError("Unknown option " + arg);
        } else {
            args.positional.push_back(arg);
            idx += 1;
        }
    }
    args.wire.was_string = args.was_string;
    return args;
}

void RequirePositional(const Args& args, std::size_t count) {
    if (args.positional.size() != count) {
        throw UsageError("Expected " + std::to_string(count) + " arguments");
    }
}

std::string PrivateKeyArg(const std::string& arg) {
    auto key = eccrypt::env::ResolvePrivateKey(arg);
    if (!key) {
        throw UsageError(std::string(eccrypt::env::kPrivateKeyVar) + " is not set");
    }
    return *key;
}

eccrypt::Content ContentArg(const std::string& text, bool bytes_hex) {
    if (!bytes_hex) {
        return text;
    }
    auto raw = eccrypt::hex::Decode(text);
    if (!raw) {
        throw UsageError("--bytes-hex content is not valid hex");
    }
    return *raw;
}

void PrintField(const std::string& name, const std::string& value) {
    std::cout << eccrypt::cli::Cyan(name + ":") << " " << value << "\n";
}

int ReportError(const eccrypt::Error& err) {
    std::cerr << eccrypt::cli::ErrorText(std::string("Error[") + eccrypt::ErrorKindName(err.kind()) + "]: ")
              << err.what() << "\n";
    return kExitFailure;
}

int RunEncrypt(const Args& args) {
    RequirePositional(args, 2);
    auto result = eccrypt::ecies::Encrypt(args.positional[0], ContentArg(args.positional[1], args.bytes_hex));
    if (!result) {
        return ReportError(result.error());
    }
    eccrypt::ecies::CipherObject::Wire wire = result.value().ToHex();
    PrintField("iv", wire.iv);
    PrintField("ephemeral_pk", wire.ephemeral_pk);
    PrintField("cipher_text", wire.cipher_text);
    PrintField("mac", wire.mac);
    PrintField("was_string", wire.was_string ? "true" : "false");
    return 0;
}

int RunDecrypt(const Args& args) {
    RequirePositional(args, 1);
    auto cipher = eccrypt::ecies::CipherObject::FromHex(args.wire);
    if (!cipher) {
        return ReportError(cipher.error());
    }
    auto plaintext = eccrypt::ecies::Decrypt(PrivateKeyArg(args.positional[0]), cipher.value());
    if (!plaintext) {
        return ReportError(plaintext.error());
    }
    if (const auto* text = std::get_if<std::string>(&plaintext.value())) {
        std::cout << *text << "\n";
    } else {
        std::cout << eccrypt::hex::Encode(std::get<eccrypt::Bytes>(plaintext.value())) << "\n";
    }
    return 0;
}

int RunSign(const Args& args) {
    RequirePositional(args, 2);
    auto result = eccrypt::ecdsa::Sign(PrivateKeyArg(args.positional[0]),
                                       ContentArg(args.positional[1], args.bytes_hex));
    if (!result) {
        return ReportError(result.error());
    }
    PrintField("signature", result.value().signature.hex());
    PrintField("public_key", result.value().public_key.hex());
    return 0;
}

int RunVerify(const Args& args) {
    RequirePositional(args, 3);
    auto result = eccrypt::ecdsa::Verify(ContentArg(args.positional[0], args.bytes_hex),
                                         args.positional[1], args.positional[2]);
    if (!result) {
        return ReportError(result.error());
    }
    if (result.value()) {
        std::cout << eccrypt::cli::BoldGreen("valid") << "\n";
        return 0;
    }
    std::cout << eccrypt::cli::BoldRed("invalid") << "\n";
    return kExitBadSignature;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    std::string command(argv[1]);
    try {
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        Args args = ParseArgs(argc, argv, 2);
        if (command == "pubkey") {
            RequirePositional(args, 1);
            std::cout << eccrypt::ec::GetPublicKeyFromPrivate(PrivateKeyArg(args.positional[0])) << "\n";
            return 0;
        }
        if (command == "encrypt") {
            return RunEncrypt(args);
        }
        if (command == "decrypt") {
            return RunDecrypt(args);
        }
        if (command == "sign") {
            return RunSign(args);
        }
        if (command == "verify") {
            return RunVerify(args);
        }
        PrintUsage();
        return kExitUsage;
    } catch (const UsageError& exc) {
        std::cerr << eccrypt::cli::ErrorText("Usage error: ") << exc.what() << "\n";
        PrintUsage();
        return kExitUsage;
    } catch (const eccrypt::Error& err) {
        return ReportError(err);
    } catch (const std::exception& exc) {
        std::cerr << eccrypt::cli::ErrorText("Error: ") << exc.what() << "\n";
        return kExitFailure;
    }
}
