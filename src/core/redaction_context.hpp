#ifndef PHISCAN_CORE_REDACTION_CONTEXT_HPP
#define PHISCAN_CORE_REDACTION_CONTEXT_HPP

#include <map>
#include <string>

namespace phiscan {
namespace core {

/*
  RedactionContext
  --------------------------------
  Document-level metadata handed through the confidence pipeline untouched.
  The detection core never interprets it; stages registered by callers may
  read it (e.g. a document type or a source system tag).
*/
struct RedactionContext
{
    std::string documentId;
    std::map<std::string, std::string> metadata;

    std::string get(const std::string &key, const std::string &fallback = std::string()) const
    {
        auto it = metadata.find(key);
        return it == metadata.end() ? fallback : it->second;
    }
};

} // namespace core
} // namespace phiscan

#endif // PHISCAN_CORE_REDACTION_CONTEXT_HPP
