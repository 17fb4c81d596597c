// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/FileUtils.h>
#include <fakeidp/Logger.h>
#include <fakeidp/StringConv.h>

#include "ResponseRequest.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "ResponseRequest");

  static const char* const encryption_types[] = { "AES-128", "AES-256", NULL };

  ResponseRequest::ResponseRequest(void)
    : digest_algorithm(DIGEST_SHA256),
      encryption_enabled(false),
      encryption_type(XMLSecNode::AES_128) {}

  static bool get_mandatory(const Config& cfg, const char* name, std::string& val) {
    val = trim((std::string)cfg[name]);
    if(val.empty()) {
      logger.msg(ERROR, "Configuration element %s is missing or empty", name);
      return false;
    }
    return true;
  }

  static bool read_credential(const Config& cfg, const char* name, std::string& val) {
    std::string path;
    if(!get_mandatory(cfg, name, path)) return false;
    path = cfg.resolvePath(path);
    if(!FileRead(path, val)) {
      logger.msg(ERROR, "Failed to read %s", path);
      return false;
    }
    logger.msg(VERBOSE, "Loaded %s from %s", name, path);
    return true;
  }

  bool ResponseRequest::LoadFromConfig(const Config& cfg) {
    if(!cfg) {
      logger.msg(ERROR, "Configuration document is not valid XML");
      return false;
    }
    if(cfg.Name() != "IdPResponse") {
      logger.msg(ERROR, "Unexpected configuration root element %s", cfg.Name());
      return false;
    }
    if(!get_mandatory(cfg, "NameID", name_id)) return false;
    if(!get_mandatory(cfg, "Issuer", issuer_uri)) return false;
    if(!get_mandatory(cfg, "ACSURL", acs_url)) return false;
    // May be supplied later by caller
    request_id = trim((std::string)cfg["RequestID"]);

    user_attributes.clear();
    for(XMLNode attr = cfg["Attribute"]; (bool)attr; ++attr) {
      std::string name = trim((std::string)attr.Attribute("Name"));
      if(name.empty()) {
        logger.msg(ERROR, "Attribute element without Name");
        return false;
      }
      user_attributes.push_back(std::make_pair(name, (std::string)attr));
    }

    std::string alg = cfg["DigestAlgorithm"];
    if(!trim(alg).empty()) {
      if(!string_to_digest(alg, digest_algorithm)) {
        logger.msg(ERROR, "Unsupported digest algorithm %s", alg);
        return false;
      }
    }

    if(!read_credential(cfg, "CertificatePath", certificate)) return false;
    if(!read_credential(cfg, "KeyPath", private_key)) return false;

    if(!Config::elementtobool(cfg, "Encryption", encryption_enabled)) {
      logger.msg(ERROR, "Encryption must be true or false");
      return false;
    }
    int enc_type = (int)encryption_type;
    if(!Config::elementtoenum(cfg, "EncryptionType", enc_type, encryption_types)) {
      logger.msg(ERROR, "Unsupported EncryptionType %s", (std::string)cfg["EncryptionType"]);
      return false;
    }
    encryption_type = (enc_type == 1) ? XMLSecNode::AES_256 : XMLSecNode::AES_128;
    return true;
  }

} // namespace FakeIdP
