/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <ctype.h>

#include "LDAPMatchRuleImpl.h"

using namespace std;

LDAPMatchRuleImpl::~LDAPMatchRuleImpl(){
}

int LDAPMatchRuleImpl::compareValues(const string& v1,
        const string& v2) const{
    return octet_string_compare(normalizeValue(v1), normalizeValue(v2));
}

bool LDAPMatchRuleImpl::valuesMatch(const string& v1,
        const string& v2) const{
    return compareValues(v1, v2) == 0;
}

bool LDAPMatchRuleImpl::substringMatches(const string& value,
        const string& subInitial, const StringList& subAny,
        const string& subFinal) const{
    string nvalue = normalizeValue(value);
    string::size_type pos = 0;

    if(!subInitial.empty()){
        string ninitial = normalizeValue(subInitial);
        if(nvalue.compare(0, ninitial.size(), ninitial) != 0){
            return false;
        }
        pos = ninitial.size();
    }

    StringList::const_iterator i;
    for(i = subAny.begin(); i != subAny.end(); i++){
        string nany = normalizeValue(*i);
        string::size_type found = nvalue.find(nany, pos);
        if(found == string::npos){
            return false;
        }
        pos = found + nany.size();
    }

    if(!subFinal.empty()){
        string nfinal = normalizeValue(subFinal);
        if(nfinal.size() > nvalue.size() - pos){
            return false;
        }
        return nvalue.compare(nvalue.size() - nfinal.size(), nfinal.size(),
                nfinal) == 0;
    }
    return true;
}

const char* LDAPMatchRuleImpl::kindToString(Kind kind){
    switch(kind){
        case EQUALITY :
            return "EQUALITY";
        case ORDERING :
            return "ORDERING";
        case SUBSTRING :
            return "SUBSTR";
        default :
            return "APPROXIMATE";
    }
}

const LDAPMatchRuleImpl* LDAPMatchRuleImpl::getDefault(Kind kind){
    static const LDAPBasicMatchRuleImpl defaults[LASTKIND] = {
        LDAPBasicMatchRuleImpl(EQUALITY, octet_string_normalize,
                octet_string_compare),
        LDAPBasicMatchRuleImpl(ORDERING, octet_string_normalize,
                octet_string_compare),
        LDAPBasicMatchRuleImpl(SUBSTRING, octet_string_normalize,
                octet_string_compare),
        LDAPBasicMatchRuleImpl(APPROXIMATE, octet_string_normalize,
                octet_string_compare)
    };
    if(kind < EQUALITY || kind >= LASTKIND){
        kind = EQUALITY;
    }
    return &defaults[kind];
}

LDAPBasicMatchRuleImpl::LDAPBasicMatchRuleImpl(Kind kind,
        LDAPNormalizeFunc normalize, LDAPCompareFunc compare) :
        m_kind(kind), m_normalize(normalize), m_compare(compare){
}

LDAPMatchRuleImpl::Kind LDAPBasicMatchRuleImpl::getKind() const{
    return m_kind;
}

string LDAPBasicMatchRuleImpl::normalizeValue(const string& value) const{
    return m_normalize(value);
}

int LDAPBasicMatchRuleImpl::compareValues(const string& v1,
        const string& v2) const{
    return m_compare(m_normalize(v1), m_normalize(v2));
}

string octet_string_normalize(const string& value){
    return value;
}

// leading and trailing spaces removed, inner runs reduced to one space
string case_exact_normalize(const string& value){
    string ret;
    bool space = false;
    for(string::size_type i = 0; i < value.size(); i++){
        if(isspace((unsigned char) value[i])){
            space = !ret.empty();
            continue;
        }
        if(space){
            ret += ' ';
            space = false;
        }
        ret += value[i];
    }
    return ret;
}

string case_ignore_normalize(const string& value){
    string ret = case_exact_normalize(value);
    for(string::size_type i = 0; i < ret.size(); i++){
        ret[i] = tolower((unsigned char) ret[i]);
    }
    return ret;
}

string numeric_string_normalize(const string& value){
    string ret;
    for(string::size_type i = 0; i < value.size(); i++){
        if(value[i] != ' '){
            ret += value[i];
        }
    }
    return ret;
}

string integer_normalize(const string& value){
    string trimmed = case_exact_normalize(value);
    string::size_type pos = 0;
    bool negative = false;
    if(pos < trimmed.size() && (trimmed[pos] == '-' || trimmed[pos] == '+')){
        negative = (trimmed[pos] == '-');
        pos++;
    }
    while(pos + 1 < trimmed.size() && trimmed[pos] == '0'){
        pos++;
    }
    string digits = trimmed.substr(pos);
    if(digits.empty() || digits == "0"){
        return digits.empty() ? trimmed : digits;
    }
    return negative ? "-" + digits : digits;
}

string boolean_normalize(const string& value){
    string ret = case_exact_normalize(value);
    for(string::size_type i = 0; i < ret.size(); i++){
        ret[i] = toupper((unsigned char) ret[i]);
    }
    return ret;
}

static bool isPhoneticFiller(char c){
    switch(c){
        case 'a': case 'e': case 'i': case 'o': case 'u':
        case 'h': case 'w': case 'y':
            return true;
        default :
            return false;
    }
}

// crude phonetic key per word: first letter kept, vowels and the
// letters h, w, y dropped, repeated letters collapsed
string approx_normalize(const string& value){
    string lower = case_ignore_normalize(value);
    string ret;
    bool wordStart = true;
    char last = 0;
    for(string::size_type i = 0; i < lower.size(); i++){
        char c = lower[i];
        if(c == ' '){
            if(!ret.empty() && ret[ret.size()-1] != ' '){
                ret += ' ';
            }
            wordStart = true;
            last = 0;
            continue;
        }
        if(!isalnum((unsigned char) c)){
            continue;
        }
        if(!wordStart && isPhoneticFiller(c)){
            last = c;
            continue;
        }
        if(c != last){
            ret += c;
        }
        last = c;
        wordStart = false;
    }
    return ret;
}

int octet_string_compare(const string& n1, const string& n2){
    int rc = n1.compare(n2);
    return rc < 0 ? -1 : (rc > 0 ? 1 : 0);
}

int integer_compare(const string& n1, const string& n2){
    bool neg1 = !n1.empty() && n1[0] == '-';
    bool neg2 = !n2.empty() && n2[0] == '-';
    if(neg1 != neg2){
        return neg1 ? -1 : 1;
    }
    int rc;
    if(n1.size() != n2.size()){
        rc = n1.size() < n2.size() ? -1 : 1;
    }else{
        rc = octet_string_compare(n1, n2);
    }
    return neg1 ? -rc : rc;
}
