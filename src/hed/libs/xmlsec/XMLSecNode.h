// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_XMLSECNODE_H__
#define __FAKEIDP_XMLSECNODE_H__

#include <string>

#include <fakeidp/XMLNode.h>

namespace FakeIdP {
/// Extends XMLNode class to support XML security operation.
/** All XMLNode methods are exposed by inheriting from XMLNode. XMLSecNode itself
does not own node, instead it uses the node from the base class XMLNode.
The xml security library must be initialized with init_xmlsec() before
EncryptNode(), DecryptNode() or VerifyNode() is used.*/
class XMLSecNode: public XMLNode {
  public:
    typedef enum {
      AES_128,
      AES_256,
      DEFAULT
    } SymEncryptionType;
   /** Create a object based on an XMLNode instance.*/
   XMLSecNode(XMLNode& node);
   ~XMLSecNode(void);
   /** Produce Exclusive XML Canonicalization (without comments) of the
    * subtree rooted at this node.
    *@param out           Canonical form of subtree
    *@param incl_namespaces  Space separated list of prefixes treated inclusively
    */
   bool Canonicalize(std::string& out, const std::string& incl_namespaces = "") const;
   /** Verify the enveloped signature under this node
    *@param id_name   The name of attribute holding identifier of this node, which
                      the <Signature/> refers to
    *@param cert_str  The certificate (PEM or DER) whose public key is
                      expected to have produced the signature. <KeyInfo/>
                      of the signature is not used for obtaining the key.
    */
   bool VerifyNode(const std::string& id_name, const std::string& cert_str);
   /** Encrypt this node, after encryption, this node will be replaced by the encrypted node
    *@param cert_str    The certificate (PEM or DER), the public key parsed from this certificate
                        is used to encrypt the symmetric key with RSA-OAEP, and then the
                        symmetric key is used to encrypt the node
    *@param encrpt_type The encryption type when encrypting the node
    */
   bool EncryptNode(const std::string& cert_str, const SymEncryptionType encrpt_type);
   /** Decrypt the <xenc:EncryptedData/> under this node, the decrypted node will be output in the second
    *argument of DecryptNode method. This node is not modified.
    *@param privkey_str    The private key (PEM or DER), which is used for decrypting
    *@param decrypted_node Output the decrypted node
    */
   bool DecryptNode(const std::string& privkey_str, XMLNode& decrypted_node);
};

} // namespace FakeIdP

#endif /* __FAKEIDP_XMLSECNODE_H__ */
