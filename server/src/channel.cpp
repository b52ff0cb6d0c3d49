#include "sftpgate/server/channel.hpp"

#include "sftpgate/error_codes.hpp"

namespace sftpgate::server
{

    void write_all(Writer &writer, std::span<const std::uint8_t> data)
    {
        while (!data.empty())
        {
            const auto written = writer.write(data);
            if (written == 0)
            {
                throw Error(ErrorCode::ShortWrite, "short write");
            }
            data = data.subspan(written);
        }
    }

    void write_all(Writer &writer, std::string_view text)
    {
        write_all(writer, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
    }

} // namespace sftpgate::server
