/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_MATCH_RULE_IMPL_H
#define LDAP_MATCH_RULE_IMPL_H

#include <string>

#include "StringList.h"

//! Normalizes an attribute value before it is compared
typedef std::string (*LDAPNormalizeFunc)(const std::string& value);

//! Compares two normalized values, result is <0, 0 or >0
typedef int (*LDAPCompareFunc)(const std::string& n1, const std::string& n2);

/**
 * The comparison semantics of a matching rule. A LDAPMatchRule holds a
 * pointer to one of these objects, they are shared and never modified.
 */
class LDAPMatchRuleImpl{
    public :
        enum Kind {
            EQUALITY=0,
            ORDERING,
            SUBSTRING,
            APPROXIMATE,
            LASTKIND /* dummy */
        };

        virtual ~LDAPMatchRuleImpl();

        virtual Kind getKind() const = 0;

        /**
         * @return The normalized form of the value
         */
        virtual std::string normalizeValue(const std::string& value) const = 0;

        /**
         * Compares the normalized forms of two values.
         * @return A negative integer, zero, or a positive integer as v1
         *      is less than, equal to, or greater than v2
         */
        virtual int compareValues(const std::string& v1,
                const std::string& v2) const;

        /**
         * @return true if compareValues() returns 0
         */
        bool valuesMatch(const std::string& v1, const std::string& v2) const;

        /**
         * Evaluates a substring assertion against a value. Empty initial
         * or final parts are not checked.
         */
        virtual bool substringMatches(const std::string& value,
                const std::string& subInitial, const StringList& subAny,
                const std::string& subFinal) const;

        static const char* kindToString(Kind kind);

        /**
         * @return The implementation used for rules without a known one:
         *      byte-wise comparison of the unmodified value
         */
        static const LDAPMatchRuleImpl* getDefault(Kind kind);
};

/**
 * Implementation assembled from a normalize and a compare function, in
 * the way slapd registers its matching rules
 */
class LDAPBasicMatchRuleImpl : public LDAPMatchRuleImpl{
    public :
        LDAPBasicMatchRuleImpl(Kind kind, LDAPNormalizeFunc normalize,
                LDAPCompareFunc compare);

        Kind getKind() const;
        std::string normalizeValue(const std::string& value) const;
        int compareValues(const std::string& v1, const std::string& v2) const;

    private :
        Kind m_kind;
        LDAPNormalizeFunc m_normalize;
        LDAPCompareFunc m_compare;
};

std::string octet_string_normalize(const std::string& value);
std::string case_exact_normalize(const std::string& value);
std::string case_ignore_normalize(const std::string& value);
std::string numeric_string_normalize(const std::string& value);
std::string integer_normalize(const std::string& value);
std::string boolean_normalize(const std::string& value);
std::string approx_normalize(const std::string& value);

int octet_string_compare(const std::string& n1, const std::string& n2);
int integer_compare(const std::string& n1, const std::string& n2);

#endif // LDAP_MATCH_RULE_IMPL_H
