#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/methods.h>
#include <cinder/runtime/modules.h>

namespace cinder::runtime
{

namespace
{

constexpr const char* kLowercase = "abcdefghijklmnopqrstuvwxyz";
constexpr const char* kUppercase = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr const char* kDigits = "0123456789";
constexpr const char* kPunctuation = R"(!"#$%&'()*+,-./:;<=>?@[\]^_`{|}~)";
constexpr const char* kWhitespace = " \t\n\r\x0b\x0c";

/** @brief string.capwords: split, capitalize each word, rejoin. */
Value string_capwords(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "capwords", 1, 2);
    if (!args.positional[0].is(ObjectKind::Str))
    {
        raise("TypeError", "capwords() argument 1 must be str, not " + type_name(args.positional[0]));
    }
    Value separator = args.positional.size() == 2 ? args.positional[1] : Value::none();

    const Value split = interp.get_attribute(args.positional[0], "split");
    std::vector<Value> split_args;
    if (!separator.is_none())
    {
        split_args.push_back(separator);
    }
    std::vector<Value> words = interp.collect(interp.call(split, split_args));
    for (auto& word : words)
    {
        word = interp.call(interp.get_attribute(word, "capitalize"), std::vector<Value>{});
    }
    const std::string glue = separator.is_none() ? std::string(" ") : str_arg(separator, "capwords");
    return make_str(join_strings(interp, glue, make_list(std::move(words))));
}

} // namespace

std::shared_ptr<ModuleObject> make_string_module()
{
    const std::string lowercase = kLowercase;
    const std::string uppercase = kUppercase;
    const std::string digits = kDigits;

    auto module = make_module("string");
    auto& m = *module;
    m.members["ascii_lowercase"] = make_str(lowercase);
    m.members["ascii_uppercase"] = make_str(uppercase);
    m.members["ascii_letters"] = make_str(lowercase + uppercase);
    m.members["digits"] = make_str(digits);
    m.members["hexdigits"] = make_str(digits + "abcdefABCDEF");
    m.members["octdigits"] = make_str("01234567");
    m.members["punctuation"] = make_str(kPunctuation);
    m.members["whitespace"] = make_str(kWhitespace);
    m.members["printable"] = make_str(digits + lowercase + uppercase + kPunctuation + kWhitespace);
    define(m, "capwords", string_capwords);
    return module;
}

} // namespace cinder::runtime
