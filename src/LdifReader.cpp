/*
 * Copyright 2008, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include "LdifReader.h"
#include "LDAPSchemaElement.h"
#include "LDAPSchemaException.h"
#include "debug.h"

#include <ctype.h>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

#include <sasl/sasl.h>
#include <sasl/saslutil.h> // For base64 routines

static std::string lineRef( int lineNo )
{
    std::ostringstream s;
    s << "LDIF line " << lineNo;
    return s.str();
}

LdifReader::LdifReader( std::istream &input )
        : m_ldifstream(input), m_curRecType(NONE), m_lineNo(0)
{
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "<> LdifReader::LdifReader()" << std::endl);
}

int LdifReader::readNextRecord()
{
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "-> LdifReader::readRecord()" << std::endl);
    std::string line;
    std::string type;
    std::string value;
    int numLine = 0;
    int recordType = NONE;
    m_currentRecord.clear();

    while ( !this->getLdifLine(line) )
    {
        if ( line.empty() )
        {
            if ( numLine == 0 ) // blank lines between records
            {
                continue;
            }
            break;
        }
        if ( line[0] == '#' )
        {
            continue;
        }
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "  Line: " << line << std::endl );
        // ends an add/delete/replace block of a modify record
        if ( recordType == MODIFY && line == "-" )
        {
            m_currentRecord.push_back(std::pair<std::string, std::string>(line, ""));
            numLine++;
            continue;
        }
        if ( this->splitLine(line, type, value) )
        {
            throw LDAPSchemaException(
                    LDAPSchemaException::MALFORMED_DEFINITION,
                    lineRef(m_lineNo), "Error while splitting ldif line");
        }
        if ( numLine == 0 )
        {
            if ( LDAPSchemaElement::equalsIgnoreCase(type, "version") )
            {
                continue;
            }
            if ( !LDAPSchemaElement::equalsIgnoreCase(type, "dn") )
            {
                throw LDAPSchemaException(
                        LDAPSchemaException::MALFORMED_DEFINITION,
                        lineRef(m_lineNo), "Record doesn't start with a DN");
            }
            LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, " Record DN:" << value << std::endl);
            recordType = ENTRY;
        }
        // might contain "changetype" to indicate a change request
        if ( numLine == 1 && LDAPSchemaElement::equalsIgnoreCase(type, "changetype") )
        {
            if ( value == "modify" )
            {
                recordType = MODIFY;
            }
            else if ( value == "add" )
            {
                recordType = ADD;
            }
            else if ( value == "delete" )
            {
                recordType = DELETE;
            }
            else if ( value == "modrdn" || value == "moddn" )
            {
                recordType = MODRDN;
            }
            else
            {
                throw LDAPSchemaException(
                        LDAPSchemaException::MALFORMED_DEFINITION,
                        lineRef(m_lineNo),
                        "Unknown change request <" + value + ">");
            }
        }
        m_currentRecord.push_back(std::pair<std::string, std::string>(type, value));
        numLine++;
    }
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "<- LdifReader::readRecord()" << std::endl);
    m_curRecType = recordType;
    return recordType;
}

const LdifRecord& LdifReader::getRecord() const
{
    return m_currentRecord;
}

int LdifReader::getRecordType() const
{
    return m_curRecType;
}

int LdifReader::getLdifLine(std::string &ldifline)
{
    if ( ! getline(m_ldifstream, ldifline) )
    {
        return -1;
    }
    m_lineNo++;

    while ( m_ldifstream &&
        (m_ldifstream.peek() == ' ' || m_ldifstream.peek() == '\t'))
    {
        std::string cat;
        m_ldifstream.ignore();
        getline(m_ldifstream, cat);
        m_lineNo++;
        ldifline += cat;
    }
    // files written on windows
    if ( !ldifline.empty() && ldifline[ldifline.size()-1] == '\r' )
    {
        ldifline.erase(ldifline.size()-1);
    }
    return 0;
}

int LdifReader::splitLine(const std::string& line,
            std::string &type,
            std::string &value)
{
    std::string::size_type pos = line.find(':');
    if ( pos == std::string::npos )
    {
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_ANY, "Invalid LDIF line. Not `:` separator"
                << std::endl );
        return -1;
    }
    type = line.substr(0, pos);
    if ( pos + 1 == line.size() )
    {
        // empty value
        value = "";
        return 0;
    }
    pos++;
    char delim = line[pos];
    if ( delim == ':' || delim == '<' )
    {
        pos++;
    }
    for( ; pos < line.size() && isspace((unsigned char) line[pos]); pos++ )
    { /* empty */ }

    value = line.substr(pos);

    if ( delim == ':' )
    {
        // Base64 encoded value
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "  base64 encoded value" << std::endl );
        std::vector<char> outbuf(value.size() + 1);
        unsigned outlen = 0;
        int rc = sasl_decode64(value.c_str(), value.size(),
                &outbuf[0], outbuf.size(), &outlen);
        if( rc == SASL_OK )
        {
            value = std::string(&outbuf[0], outlen);
        }
        else if ( rc == SASL_BADPROT )
        {
            value = "";
            LDAPSCHEMA_DEBUG( LDAPSCHEMA_DEBUG_TRACE, " invalid base64 content" << std::endl );
            return -1;
        }
        else
        {
            value = "";
            LDAPSCHEMA_DEBUG( LDAPSCHEMA_DEBUG_TRACE, " base64 decoding failed"
                    << std::endl );
            return -1;
        }
    }
    else if ( delim == '<' )
    {
        // URL value
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "  url value" << std::endl );
        return -1;
    }
    else
    {
        // "normal" value
        LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "  string value" << std::endl );
    }
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "  Type: <" << type << ">" << std::endl );
    LDAPSCHEMA_DEBUG(LDAPSCHEMA_DEBUG_TRACE, "  Value: <" << value << ">" << std::endl );
    return 0;
}
