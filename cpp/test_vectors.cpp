#include <iostream>
#include <string>
#include <variant>
#include "eccrypt/ecdsa.hpp"
#include "eccrypt/ecies.hpp"

int main() {
    const std::string privateKey = "e9873d79c6d87dc0fb6a5778633389f4453213303da61f20bd67fc233aa33262";
    const std::string publicKey = "02588d202afcc1ee4ab5254c7847ec25b9a135bbda0f2bc69ee1a714749fd77dc9";
    const std::string expected = "all work and no play makes jack a dull boy";
    bool ok = true;

    // Produced by an independent AES-256-CBC / HMAC-SHA256 / secp256k1 implementation
    eccrypt::ecies::CipherObject::Wire wire;
    wire.iv = "000102030405060708090a0b0c0d0e0f";
    wire.ephemeral_pk = "0243f8c41498980a79e07b2f93aca5fb513b29ab1ad1dd328044e16d8eb883ba42";
    wire.cipher_text = "16af6618ddfb1acbed766c993aa2ad326d9ae608528d824cd8dfee0ff3c99e53"
                       "07ce23b3b12190ff2a09bb874af138bc";
    wire.mac = "3e93a9fd48d98a61f80ba298efc8d5fcc1ffceba37b19fe45436a4a207e94989";
    wire.was_string = true;

    std::cout << "C++ decrypting externally produced ECIES object:" << std::endl;
    auto cipher = eccrypt::ecies::CipherObject::FromHex(wire);
    auto plaintext = cipher ? eccrypt::ecies::Decrypt(privateKey, cipher.value())
                            : eccrypt::Result<eccrypt::Content>(cipher.error());
    if (!plaintext) {
        std::cout << "  Error: " << plaintext.error().what() << std::endl;
        ok = false;
    } else {
        const std::string* decoded = std::get_if<std::string>(&plaintext.value());
        bool match = decoded && *decoded == expected;
        std::cout << "  Decrypted (in C++): " << (decoded ? *decoded : std::string("<bytes>")) << std::endl;
        std::cout << "  Expected: " << expected << std::endl;
        std::cout << "  Match: " << (match ? "true" : "false") << std::endl;
        ok = ok && match;
    }

    // Externally produced DER signature over "hello world"
    const std::string signature = "304402200e252a5fd4ce45542d6d83eb2aab55eecbc69201839d68e1cf4a6f19dbf16f90"
                                  "022040cee42a438033ab27074e849705a6fe3a4d98b179e40718f1816e32dcd7b71c";
    std::cout << "\nC++ verifying externally produced signature:" << std::endl;
    auto verified = eccrypt::ecdsa::Verify(std::string("hello world"), publicKey, signature);
    bool valid = verified && verified.value();
    std::cout << "  Valid: " << (valid ? "true" : "false") << std::endl;
    ok = ok && valid;

    std::cout << "\nC++ encryption for other implementations:" << std::endl;
    auto sealed = eccrypt::ecies::Encrypt(publicKey, std::string("C++ to JavaScript test"));
    if (!sealed) {
        std::cout << "  Error: " << sealed.error().what() << std::endl;
        return 1;
    }
    eccrypt::ecies::CipherObject::Wire out = sealed.value().ToHex();
    std::cout << "  iv: " << out.iv << std::endl;
    std::cout << "  ephemeralPK: " << out.ephemeral_pk << std::endl;
    std::cout << "  cipherText: " << out.cipher_text << std::endl;
    std::cout << "  mac: " << out.mac << std::endl;

    return ok ? 0 : 1;
}
