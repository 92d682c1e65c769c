#include <stddef.h>
#include <stdint.h>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "config.hpp"
#include "qr.hpp"

namespace
{

    int Fail(QR::Status st)
    {
        return QR::ReportError(std::cerr, st);
    }

    /// Fill the config from the parsed options. Byte list wins over text, text over the default payload.
    QR::Status BuildConfig(const cxxopts::ParseResult& result, QR::EncodeConfig* config)
    {
        QR::Status st = QR::ParseVersion(result["version"].as<std::string>(), &config->version);
        if(st != QR::STATUS_OK) return st;

        st = QR::ParseEcl(result["ecl"].as<std::string>(), &config->ecl);
        if(st != QR::STATUS_OK) return st;

        st = QR::ParseMask(result["mask"].as<std::string>(), &config->mask);
        if(st != QR::STATUS_OK) return st;

        const bool has_bytes = result.count("bytes") > 0;
        const bool has_text = result.count("text") > 0;
        std::string bytes = has_bytes ? result["bytes"].as<std::string>() : std::string();
        std::string text = has_text ? result["text"].as<std::string>() : std::string();

        st = QR::ApplyOptions(has_bytes ? &bytes : NULL, has_text ? &text : NULL, config);
        if(st != QR::STATUS_OK) return st;

        return config->Validate();
    }

} // namespace

int main(int argc, char** argv)
{
    cxxopts::Options options("qrcoder-cli", "Encode bytes into a QR Code module grid");
    options.add_options()
        ("t,text", "Text payload", cxxopts::value<std::string>())
        ("b,bytes", "Comma separated byte values, e.g. 72,105", cxxopts::value<std::string>())
        ("v,version", "Symbol version 1-40", cxxopts::value<std::string>()->default_value("7"))
        ("e,ecl", "Error correction level L, M, Q or H", cxxopts::value<std::string>()->default_value("Q"))
        ("m,mask", "Mask pattern 0-7 or auto", cxxopts::value<std::string>()->default_value("auto"))
        ("c,chars", "Characters for dark and light modules", cxxopts::value<std::string>()->default_value("10"))
        ("h,help", "Print usage");

    QR::EncodeConfig config;
    std::string chars;
    try
    {
        cxxopts::ParseResult result = options.parse(argc, argv);
        if(result.count("help"))
        {
            std::cout << options.help() << std::endl;
            return 0;
        }

        QR::Status st = BuildConfig(result, &config);
        if(st != QR::STATUS_OK) return Fail(st);

        chars = result["chars"].as<std::string>();
        if(chars.size() != 2) return Fail(QR::STATUS_INVALID_INPUT);
    }
    catch(const std::exception& e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    QR::Encoder encoder;
    QR::Status st = encoder.Init(config.version, config.ecl, config.mask);
    if(st != QR::STATUS_OK) return Fail(st);

    QR::Matrix matrix;
    st = encoder.Render(config.data, QR::MODE_BYTE, &matrix);
    if(st != QR::STATUS_OK) return Fail(st);

    QR::WriteMatrix(std::cout, matrix, chars[0], chars[1], encoder.SelectedMask());
    return 0;
}
