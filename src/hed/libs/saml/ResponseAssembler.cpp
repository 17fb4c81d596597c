// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/Base64.h>
#include <fakeidp/Logger.h>
#include <fakeidp/crypto/Certificate.h>

#include "SAMLConstants.h"
#include "SAMLResponseError.h"
#include "ResponseAssembler.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "ResponseAssembler");

  ResponseAssembler::ResponseAssembler(const ResponseRequest& request, const ResponseContext& context)
    : request_(request),
      context_(context) {}

  std::string ResponseAssembler::Assemble(void) const {
    NS samlp_ns("samlp", SAMLP_NAMESPACE);
    NS saml_ns("saml", SAML_NAMESPACE);

    XMLNode response(samlp_ns, "samlp:Response");
    if(!response) throw SAMLResponseError("Failed to create response document");
    response.NewAttribute("Consent") = SAML_CONSENT_UNSPECIFIED;
    response.NewAttribute("Destination") = request_.acs_url;
    response.NewAttribute("ID") = context_.ResponseID();
    response.NewAttribute("InResponseTo") = request_.request_id;
    response.NewAttribute("IssueInstant") = context_.IssueInstant();
    response.NewAttribute("Version") = SAML_VERSION;

    XMLNode issuer = response.NewChild("saml:Issuer", saml_ns);
    issuer = request_.issuer_uri;

    XMLNode status = response.NewChild("samlp:Status");
    status.NewChild("samlp:StatusCode").NewAttribute("Value") = SAML_STATUS_SUCCESS;

    AddAssertion(response);

    std::string xml;
    response.GetDoc(xml);
    logger.msg(VERBOSE, "Assembled response %s with assertion %s",
               context_.ResponseID(), context_.AssertionID());
    return xml;
  }

  void ResponseAssembler::AddAssertion(XMLNode response) const {
    XMLNode assertion = response.NewChild("saml:Assertion", NS("saml", SAML_NAMESPACE));
    assertion.NewAttribute("ID") = context_.AssertionID();
    assertion.NewAttribute("IssueInstant") = context_.IssueInstant();
    assertion.NewAttribute("Version") = SAML_VERSION;

    XMLNode issuer = assertion.NewChild("saml:Issuer");
    issuer.NewAttribute("Format") = SAML_NAMEID_ENTITY;
    issuer = request_.issuer_uri;

    AddSignature(assertion);
    AddSubject(assertion);

    XMLNode conditions = assertion.NewChild("saml:Conditions");
    conditions.NewAttribute("NotBefore") = context_.NotBefore();
    conditions.NewAttribute("NotOnOrAfter") = context_.NotOnOrAfter();
    conditions.NewChild("saml:AudienceRestriction").NewChild("saml:Audience") = request_.issuer_uri;

    XMLNode statement = assertion.NewChild("saml:AttributeStatement");
    for(AttributeList::const_iterator a = request_.user_attributes.begin();
        a != request_.user_attributes.end(); ++a) {
      XMLNode attribute = statement.NewChild("saml:Attribute");
      attribute.NewAttribute("Name") = a->first;
      attribute.NewChild("saml:AttributeValue") = a->second;
    }

    XMLNode authn = assertion.NewChild("saml:AuthnStatement");
    authn.NewAttribute("AuthnInstant") = context_.IssueInstant();
    authn.NewAttribute("SessionIndex") = context_.ResponseID();
    authn.NewChild("saml:AuthnContext").NewChild("saml:AuthnContextClassRef") = SAML_AUTHN_CONTEXT_CLASS;
  }

  void ResponseAssembler::AddSignature(XMLNode assertion) const {
    std::string der;
    if(!CertificateToDER(request_.certificate, der))
      throw SAMLResponseError("Certificate is not a valid PEM or DER X.509 certificate");

    XMLNode signature = assertion.NewChild("ds:Signature", NS("ds", DSIG_NAMESPACE));
    XMLNode signed_info = signature.NewChild("ds:SignedInfo");
    signed_info.NewChild("ds:CanonicalizationMethod").NewAttribute("Algorithm") = DSIG_EXC_C14N;
    signed_info.NewChild("ds:SignatureMethod").NewAttribute("Algorithm") =
      SignatureMethodURI(request_.digest_algorithm);

    XMLNode reference = signed_info.NewChild("ds:Reference");
    reference.NewAttribute("URI") = context_.ReferenceURI();
    XMLNode transforms = reference.NewChild("ds:Transforms");
    transforms.NewChild("ds:Transform").NewAttribute("Algorithm") = DSIG_ENVELOPED_SIGNATURE;
    transforms.NewChild("ds:Transform").NewAttribute("Algorithm") = DSIG_EXC_C14N;
    reference.NewChild("ds:DigestMethod").NewAttribute("Algorithm") =
      DigestMethodURI(request_.digest_algorithm);
    // Filled by DigestStage
    reference.NewChild("ds:DigestValue");

    // Filled by SignatureStage
    signature.NewChild("ds:SignatureValue");

    signature.NewChild("ds:KeyInfo").NewChild("ds:X509Data").NewChild("ds:X509Certificate") =
      Base64::encode(der);
  }

  void ResponseAssembler::AddSubject(XMLNode assertion) const {
    XMLNode subject = assertion.NewChild("saml:Subject");
    XMLNode name_id = subject.NewChild("saml:NameID");
    name_id.NewAttribute("Format") = SAML_NAMEID_EMAIL;
    name_id = request_.name_id;

    XMLNode confirmation = subject.NewChild("saml:SubjectConfirmation");
    confirmation.NewAttribute("Method") = SAML_CM_BEARER;
    XMLNode data = confirmation.NewChild("saml:SubjectConfirmationData");
    data.NewAttribute("InResponseTo") = request_.request_id;
    data.NewAttribute("NotOnOrAfter") = context_.ConfirmationNotOnOrAfter();
    data.NewAttribute("Recipient") = request_.acs_url;
  }

} // namespace FakeIdP
