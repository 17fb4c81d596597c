#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iostream>
#include <cstdlib>
#include <locale.h>

#include <fakeidp/IdPConfig.h>
#include <fakeidp/FileUtils.h>
#include <fakeidp/IString.h>
#include <fakeidp/Logger.h>
#include <fakeidp/OptionParser.h>
#include <fakeidp/crypto/Digest.h>
#include <fakeidp/xmlsec/XmlSecUtils.h>
#include <fakeidp/saml/SAMLResponse.h>

int main(int argc, char* argv[]){

    setlocale(LC_ALL, "");

    FakeIdP::Logger logger(FakeIdP::Logger::getRootLogger(), "fakeidp-response");
    FakeIdP::LogStream logcerr(std::cerr);
    logcerr.setFormat(FakeIdP::ShortFormat);
    FakeIdP::Logger::getRootLogger().addDestination(logcerr);
    FakeIdP::Logger::getRootLogger().setThreshold(FakeIdP::WARNING);

    FakeIdP::OptionParser options("",
                      istring("Produce signed SAML 2.0 response"),
                      istring("Response content and credentials are taken from "
                              "IdPResponse configuration document. The response "
                              "is written to standard output unless output file "
                              "is specified."));

    std::string config_path;
    options.AddOption('c', "config",
                      istring("path to config file"),
                      istring("path"), config_path);

    std::string request_id;
    options.AddOption('r', "request-id",
                      istring("InResponseTo value overriding configuration"),
                      istring("id"), request_id);

    std::string output_path;
    options.AddOption('o', "output",
                      istring("write response to file"),
                      istring("path"), output_path);

    bool encrypt = false;
    options.AddOption('e', "encrypt",
                      istring("encrypt assertion even if configuration does not ask for it"),
                      encrypt);

    std::string algorithm;
    options.AddOption('a', "algorithm",
                      istring("digest and signature algorithm: SHA1, SHA256, SHA384 or SHA512"),
                      istring("name"), algorithm);

    std::string debug;
    options.AddOption('d', "debug",
                      istring("FATAL, ERROR, WARNING, INFO, VERBOSE or DEBUG"),
                      istring("debuglevel"), debug);

    bool version = false;
    options.AddOption('v', "version", istring("print version information"),
                      version);

    std::list<std::string> params;
    if (!options.Parse(argc, argv, params)) return EXIT_FAILURE;

    if (version) {
        std::cout << FakeIdP::IString("%s version %s", "fakeidp-response", VERSION)
                  << std::endl;
        return EXIT_SUCCESS;
    }

    if (!debug.empty()) {
        FakeIdP::LogLevel level;
        if (!FakeIdP::istring_to_level(debug, level)) {
            logger.msg(FakeIdP::ERROR, "Unknown debug level: %s", debug);
            return EXIT_FAILURE;
        }
        FakeIdP::Logger::getRootLogger().setThreshold(level);
    }

    if (!params.empty()) {
        logger.msg(FakeIdP::ERROR, "Unexpected arguments");
        return EXIT_FAILURE;
    }

    if (config_path.empty()) {
        logger.msg(FakeIdP::ERROR, "Configuration file must be specified with --config");
        return EXIT_FAILURE;
    }

    FakeIdP::Config cfg(config_path.c_str());
    if (!cfg) {
        logger.msg(FakeIdP::ERROR, "Failed to load configuration from %s", config_path);
        return EXIT_FAILURE;
    }

    FakeIdP::ResponseRequest request;
    if (!request.LoadFromConfig(cfg)) {
        logger.msg(FakeIdP::ERROR, "Configuration %s is not usable", config_path);
        return EXIT_FAILURE;
    }

    if (!request_id.empty()) request.request_id = request_id;
    if (encrypt) request.encryption_enabled = true;
    if (!algorithm.empty()) {
        if (!FakeIdP::string_to_digest(algorithm, request.digest_algorithm)) {
            logger.msg(FakeIdP::ERROR, "Unsupported algorithm: %s", algorithm);
            return EXIT_FAILURE;
        }
    }
    logger.msg(FakeIdP::INFO, "Using %s for digest and signature",
               FakeIdP::digest_to_string(request.digest_algorithm));

    std::string xml;
    try {
      FakeIdP::SAMLResponse response(request);
      xml = response.Build();
    } catch (FakeIdP::SAMLResponseError& e) {
      FakeIdP::final_xmlsec();
      logger.msg(FakeIdP::ERROR, "Failed to produce response: %s", e.what());
      return EXIT_FAILURE;
    }
    FakeIdP::final_xmlsec();

    if (output_path.empty()) {
        std::cout << xml;
    } else if (!FakeIdP::FileCreate(output_path, xml)) {
        logger.msg(FakeIdP::ERROR, "Failed to write response to %s", output_path);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
