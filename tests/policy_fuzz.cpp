#include <cinder/policy/checker.h>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size)
{
    const std::string input(reinterpret_cast<const char*>(data), size);

    // check() lexes, parses and walks; it must return a decision for any byte string.
    const auto decision = cinder::policy::check(input);
    if (const auto* rejected = std::get_if<cinder::policy::Rejected>(&decision))
    {
        (void)cinder::policy::describe(*rejected, input);
    }

    return 0;
}

#ifdef CINDER_FUZZER_STANDALONE
int main(int argc, char** argv)
{
    if (argc != 2)
    {
        return 2;
    }

    std::ifstream in(argv[1], std::ios::binary);
    if (!in)
    {
        return 2;
    }

    const std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return LLVMFuzzerTestOneInput(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}
#endif
