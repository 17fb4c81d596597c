// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <vector>

#include <libxml/c14n.h>
#include <libxml/valid.h>

#include <xmlsec/xmlsec.h>
#include <xmlsec/buffer.h>
#include <xmlsec/xmltree.h>
#include <xmlsec/xmldsig.h>
#include <xmlsec/xmlenc.h>
#include <xmlsec/templates.h>
#include <xmlsec/crypto.h>

#include <fakeidp/Logger.h>
#include <fakeidp/StringConv.h>
#include <fakeidp/Utils.h>

#include "XmlSecUtils.h"
#include "XMLSecNode.h"

namespace FakeIdP {

static Logger logger(Logger::getRootLogger(), "XMLSecNode");

XMLSecNode::XMLSecNode(XMLNode& node):XMLNode(node) {
  if(node_ && (node_->type != XML_ELEMENT_NODE)) node_ = NULL;
}

XMLSecNode::~XMLSecNode(void) {
}

// Tells canonicalizer which nodes belong to the subtree rooted at
// user_data. Namespace nodes are judged by the element carrying them.
static int c14n_subtree_visible(void* user_data, xmlNodePtr node, xmlNodePtr parent) {
  xmlNodePtr root = (xmlNodePtr)user_data;
  xmlNodePtr n = node;
  if((n == NULL) || (n->type == XML_NAMESPACE_DECL)) n = parent;
  for(; n; n = n->parent) {
    if(n == root) return 1;
  }
  return 0;
}

static int c14n_write(void* context, const char* buffer, int len) {
  if((context == NULL) || (len < 0)) return -1;
  if(len == 0) return 0;
  ((std::string*)context)->append(buffer, len);
  return len;
}

static int c14n_close(void* /* context */) {
  return 0;
}

bool XMLSecNode::Canonicalize(std::string& out, const std::string& incl_namespaces) const {
  out.clear();
  if(!node_) return false;
  xmlDocPtr doc = node_->doc;
  if(doc == NULL) return false;

  std::vector<std::string> prefixes;
  tokenize(incl_namespaces, prefixes, " \t");
  std::vector<xmlChar*> incl_list;
  for(std::vector<std::string>::iterator p = prefixes.begin(); p != prefixes.end(); ++p) {
    incl_list.push_back((xmlChar*)(p->c_str()));
  }
  incl_list.push_back(NULL);

  std::string result;
  xmlOutputBufferPtr buf = xmlOutputBufferCreateIO(&c14n_write, &c14n_close, &result, NULL);
  if(buf == NULL) {
    logger.msg(ERROR, "Failed to create output buffer for canonicalization");
    return false;
  }
  int r = xmlC14NExecute(doc, &c14n_subtree_visible, node_,
                         XML_C14N_EXCLUSIVE_1_0, prefixes.empty() ? NULL : &incl_list[0],
                         0, buf);
  xmlOutputBufferClose(buf);
  if(r < 0) {
    logger.msg(ERROR, "Failed to canonicalize node %s", Name());
    return false;
  }
  out = result;
  logger.msg(DEBUG, "Canonical form of %s: %s", Name(), out);
  return true;
}

bool XMLSecNode::VerifyNode(const std::string& id_name, const std::string& cert_str) {
  if(!node_) return false;
  xmlAttrPtr id_attr = xmlHasProp(node_, (const xmlChar*)id_name.c_str());
  xmlChar *id = id_attr ? xmlNodeListGetString(node_->doc, id_attr->children, 1) : NULL;
  if(!id) {
    logger.msg(ERROR, "Element %s has no %s attribute", Name(), id_name);
    return false;
  }
  // Reference URI "#id" is looked up in the ID table of the document
  if(!xmlGetID(node_->doc, id)) xmlAddID(NULL, node_->doc, id, id_attr);
  xmlFree(id);

  XMLNode signature = (*this)["Signature"];
  if(!signature) {
    logger.msg(ERROR, "Element %s carries no Signature", Name());
    return false;
  }
  AutoPointer<xmlSecDSigCtx> ctx(xmlSecDSigCtxCreate(NULL), &xmlSecDSigCtxDestroy);
  if(!ctx) {
    logger.msg(ERROR, "Failed to create signature context");
    return false;
  }
  ctx->signKey = xmlsec_public_key(cert_str);
  if(!ctx->signKey) return false;
  if(xmlSecDSigCtxVerify(ctx.Ptr(), signature.node_) < 0) {
    logger.msg(ERROR, "Failed to process signature of %s", Name());
    return false;
  }
  if(ctx->status != xmlSecDSigStatusSucceeded) {
    logger.msg(VERBOSE, "Signature of %s does not match", Name());
    return false;
  }
  logger.msg(VERBOSE, "Signature of %s is valid", Name());
  return true;
}

// Fills EncryptedData template with CipherValue and KeyInfo holding an
// RSA-OAEP EncryptedKey
static bool complete_template(xmlNodePtr enc_data) {
  if(!xmlSecTmplEncDataEnsureCipherValue(enc_data)) return false;
  xmlNodePtr key_info = xmlSecTmplEncDataEnsureKeyInfo(enc_data, NULL);
  if(!key_info) return false;
  xmlNodePtr enc_key = xmlSecTmplKeyInfoAddEncryptedKey(key_info, xmlSecTransformRsaOaepId,
                                                        NULL, NULL, NULL);
  if(!enc_key) return false;
  if(!xmlSecTmplEncDataEnsureCipherValue(enc_key)) return false;
  return (xmlSecTmplEncDataEnsureKeyInfo(enc_key, NULL) != NULL);
}

bool XMLSecNode::EncryptNode(const std::string& cert_str, const SymEncryptionType encrpt_type) {
  if(!node_) return false;
  xmlDocPtr doc = node_->doc;
  if(node_ == xmlDocGetRootElement(doc)) {
    // Owner of the document would keep pointing to the freed element
    logger.msg(ERROR, "Root element of document can not be encrypted in place");
    return false;
  }
  xmlSecTransformId cipher = xmlSecTransformAes128CbcId;
  xmlSecSize key_bits = 128;
  if(encrpt_type == AES_256) {
    cipher = xmlSecTransformAes256CbcId;
    key_bits = 256;
  }

  AutoPointer<xmlNode> tmpl(xmlSecTmplEncDataCreate(doc, cipher, NULL, xmlSecTypeEncElement, NULL, NULL),
                            &xmlFreeNode);
  if(!tmpl || !complete_template(tmpl.Ptr())) {
    logger.msg(ERROR, "Failed to create encryption template");
    return false;
  }
  AutoPointer<xmlSecKeysMngr> mngr(xmlsec_keys_manager(cert_str), &xmlSecKeysMngrDestroy);
  if(!mngr) return false;
  AutoPointer<xmlSecEncCtx> ctx(xmlSecEncCtxCreate(mngr.Ptr()), &xmlSecEncCtxDestroy);
  if(!ctx) {
    logger.msg(ERROR, "Failed to create encryption context");
    return false;
  }
  ctx->encKey = xmlSecKeyGenerate(xmlSecKeyDataAesId, key_bits, xmlSecKeyDataTypeSession);
  if(!ctx->encKey) {
    logger.msg(ERROR, "Failed to generate %u bit session key", (unsigned int)key_bits);
    return false;
  }
  if(xmlSecEncCtxXmlEncrypt(ctx.Ptr(), tmpl.Ptr(), node_) < 0) {
    logger.msg(ERROR, "Failed to encrypt %s", Name());
    return false;
  }
  // Element is gone, template took its place
  node_ = tmpl.Release();
  return true;
}

// Copy of node as root of a new document
static xmlDocPtr standalone_copy(xmlNodePtr node) {
  xmlDocPtr doc = xmlNewDoc((const xmlChar*)"1.0");
  if(!doc) return NULL;
  xmlNodePtr copy = xmlDocCopyNode(node, doc, 1);
  if(!copy) {
    xmlFreeDoc(doc);
    return NULL;
  }
  xmlDocSetRootElement(doc, copy);
  return doc;
}

bool XMLSecNode::DecryptNode(const std::string& privkey_str, XMLNode& decrypted_node) {
  XMLNode data = MatchXMLName(*this, "EncryptedData") ? XMLNode(*this) : (*this)["EncryptedData"];
  if(!data) {
    logger.msg(ERROR, "No EncryptedData at %s", Name());
    return false;
  }
  std::string algorithm = data["EncryptionMethod"].Attribute("Algorithm");
  if(algorithm.find("#aes") == std::string::npos) {
    logger.msg(ERROR, "Unsupported EncryptionMethod %s", algorithm);
    return false;
  }
  XMLNode enc_key = data["KeyInfo"]["EncryptedKey"];
  if(!enc_key) {
    logger.msg(ERROR, "No EncryptedKey in KeyInfo");
    return false;
  }

  // Decryption replaces nodes it works on, so this tree is left alone
  AutoPointer<xmlDoc> key_doc(standalone_copy(enc_key.node_), &xmlFreeDoc);
  AutoPointer<xmlDoc> data_doc(standalone_copy(data.node_), &xmlFreeDoc);
  if(!key_doc || !data_doc) return false;

  AutoPointer<xmlSecEncCtx> key_ctx(xmlSecEncCtxCreate(NULL), &xmlSecEncCtxDestroy);
  AutoPointer<xmlSecEncCtx> data_ctx(xmlSecEncCtxCreate(NULL), &xmlSecEncCtxDestroy);
  if(!key_ctx || !data_ctx) {
    logger.msg(ERROR, "Failed to create encryption context");
    return false;
  }
  key_ctx->encKey = xmlsec_private_key(privkey_str);
  if(!key_ctx->encKey) return false;
  key_ctx->mode = xmlEncCtxModeEncryptedKey;
  xmlSecBufferPtr raw = xmlSecEncCtxDecryptToBuffer(key_ctx.Ptr(), xmlDocGetRootElement(key_doc.Ptr()));
  if(!raw) {
    logger.msg(ERROR, "Failed to decrypt EncryptedKey");
    return false;
  }
  data_ctx->encKey = xmlSecKeyReadMemory(xmlSecKeyDataAesId,
                                         xmlSecBufferGetData(raw), xmlSecBufferGetSize(raw));
  if(!data_ctx->encKey) {
    logger.msg(ERROR, "Decrypted session key is not a usable AES key");
    return false;
  }
  data_ctx->mode = xmlEncCtxModeEncryptedData;
  raw = xmlSecEncCtxDecryptToBuffer(data_ctx.Ptr(), xmlDocGetRootElement(data_doc.Ptr()));
  if(!raw) {
    logger.msg(ERROR, "Failed to decrypt EncryptedData");
    return false;
  }
  std::string plain((const char*)xmlSecBufferGetData(raw), xmlSecBufferGetSize(raw));
  logger.msg(DEBUG, "Decrypted node: %s", plain);

  XMLNode parsed(plain);
  if(!parsed) {
    logger.msg(ERROR, "Decrypted data is not well formed XML");
    return false;
  }
  parsed.New(decrypted_node);
  return true;
}

} // namespace FakeIdP
