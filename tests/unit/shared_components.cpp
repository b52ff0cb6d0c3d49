#include <cassert>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "sftpgate/crypto.hpp"
#include "sftpgate/digest.hpp"
#include "sftpgate/encoding/base64.hpp"
#include "sftpgate/error_codes.hpp"
#include "sftpgate/version.hpp"
#include "sftpgate/wire.hpp"

#include "test_support.hpp"

using namespace sftpgate;

void run_server_component_tests();
void run_transfer_tests();
void run_scp_tests();
void run_ssh_command_tests();
void run_host_key_tests();
void run_sftp_tests();
void run_listener_tests();

namespace
{

    void test_base64()
    {
        const std::string text = "any carnal pleas";
        const auto encoded = encoding::encode_base64(test::bytes_of(text));
        assert(encoded == "YW55IGNhcm5hbCBwbGVhcw==");
        const auto decoded = encoding::decode_base64(encoded);
        assert(test::string_of(decoded) == text);

        // Whitespace inside the input is ignored, as in multi-line key files.
        const auto wrapped = encoding::decode_base64("YW55IGNh\ncm5hbCBw bGVhcw==");
        assert(test::string_of(wrapped) == text);

        assert(test::error_code_of([] { (void)encoding::decode_base64("YW5*"); }) == ErrorCode::SyntaxError);
        assert(test::error_code_of([] { (void)encoding::decode_base64("YQ==YQ"); }) == ErrorCode::SyntaxError);
    }

    void test_wire_encoding()
    {
        wire::Writer writer;
        writer.put_u32(0x01020304u).put_u64(0x1122334455667788ull).put_string("ssh-ed25519");
        const auto data = writer.take();
        assert(data.size() == 4 + 8 + 4 + 11);
        assert(data[0] == 0x01 && data[3] == 0x04);

        wire::Reader reader(data);
        assert(reader.read_u32() == 0x01020304u);
        assert(reader.read_u64() == 0x1122334455667788ull);
        assert(reader.read_string() == "ssh-ed25519");
        assert(reader.empty());
        assert(test::error_code_of([&reader] { (void)reader.read_u32(); }) == ErrorCode::SyntaxError);

        // A string whose declared length exceeds the buffer.
        const std::vector<std::uint8_t> truncated{0, 0, 0, 9, 'a', 'b'};
        wire::Reader short_reader(truncated);
        assert(test::error_code_of([&short_reader] { (void)short_reader.read_string(); }) == ErrorCode::SyntaxError);
    }

    void test_wire_mpint()
    {
        const std::vector<std::uint8_t> high_bit{0x00, 0x00, 0x80, 0x01};
        wire::Writer writer;
        writer.put_mpint(high_bit);
        const std::vector<std::uint8_t> expected{0, 0, 0, 3, 0x00, 0x80, 0x01};
        assert(writer.data() == expected);

        wire::Writer small;
        const std::vector<std::uint8_t> value{0x7f};
        small.put_mpint(value);
        const std::vector<std::uint8_t> expected_small{0, 0, 0, 1, 0x7f};
        assert(small.data() == expected_small);

        wire::Writer zero;
        const std::vector<std::uint8_t> zeros{0x00, 0x00};
        zero.put_mpint(zeros);
        const std::vector<std::uint8_t> expected_zero{0, 0, 0, 0};
        assert(zero.data() == expected_zero);
    }

    void test_crypto()
    {
        const std::string password = "correct horse battery staple";
        const auto hashed = crypto::hash_password(password);
        assert(crypto::verify_password(password, hashed));
        assert(!crypto::verify_password("wrong password", hashed));

        const auto id = crypto::random_hex(6);
        assert(id.size() == 12);
        assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(crypto::random_hex(6) != id);

        const std::vector<std::uint8_t> a{1, 2, 3};
        const std::vector<std::uint8_t> b{1, 2, 4};
        assert(crypto::constant_time_equals(a, a));
        assert(!crypto::constant_time_equals(a, b));
        assert(!crypto::constant_time_equals(a, std::span<const std::uint8_t>(a.data(), 2)));
    }

    void test_digest()
    {
        const std::string abc = "abc";
        assert(digest::hash_bytes(digest::Algorithm::Md5, test::bytes_of(abc)) == "900150983cd24fb0d6963f7d28e17f72");
        assert(digest::hash_bytes(digest::Algorithm::Sha1, test::bytes_of(abc)) ==
               "a9993e364706816aba3e25717850c26c9cd0d89d");
        assert(digest::hash_bytes(digest::Algorithm::Sha256, test::bytes_of(abc)) ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        digest::Digest streaming(digest::Algorithm::Sha256);
        streaming.update(test::bytes_of("a"));
        streaming.update(test::bytes_of("bc"));
        assert(streaming.final_hex() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        const auto file_path = std::filesystem::temp_directory_path() / "sftpgate_digest_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file << abc;
        }
        assert(digest::hash_file(digest::Algorithm::Md5, file_path) == "900150983cd24fb0d6963f7d28e17f72");
        std::filesystem::remove(file_path);
        assert(test::error_code_of([&file_path] { (void)digest::hash_file(digest::Algorithm::Md5, file_path); }) ==
               ErrorCode::NotFound);

        assert(digest::algorithm_from_string("sha512") == digest::Algorithm::Sha512);
        assert(!digest::algorithm_from_string("crc32").has_value());
        const std::vector<std::uint8_t> raw{0x00, 0xab, 0xff};
        assert(digest::to_hex(raw) == "00abff");
    }

    void test_error_codes()
    {
        assert(error_code_from_errno(ENOENT) == ErrorCode::NotFound);
        assert(error_code_from_errno(EACCES) == ErrorCode::PermissionDenied);
        assert(error_code_from_errno(EDQUOT) == ErrorCode::QuotaExceeded);
        assert(error_code_from_errno(EIO) == ErrorCode::GenericFailure);
        assert(error_code_from_int(to_int(ErrorCode::TransferClosed)) == ErrorCode::TransferClosed);

        const Error error(ErrorCode::QuotaExceeded);
        assert(error.code() == ErrorCode::QuotaExceeded);
        assert(!std::string(error.what()).empty());
        assert(!version().empty());
    }

} // namespace

int main()
{
    // Writes to a closed child pipe must fail with EPIPE instead of killing the runner.
    std::signal(SIGPIPE, SIG_IGN);
    try
    {
        test_base64();
        test_wire_encoding();
        test_wire_mpint();
        test_crypto();
        test_digest();
        test_error_codes();
        run_server_component_tests();
        run_transfer_tests();
        run_scp_tests();
        run_ssh_command_tests();
        run_host_key_tests();
        run_sftp_tests();
        run_listener_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
