/*
 * Copyright 2008, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDIF_READER_H
#define LDIF_READER_H

#include <iosfwd>
#include <list>
#include <string>
#include <utility>

typedef std::list< std::pair<std::string, std::string> > LdifRecord;

/**
 * Reads the records of a LDIF file (RFC 2849), e.g. an export of the
 * subschema subentry of a server
 */
class LdifReader
{
    public:
        enum RecordType {
            NONE=0,
            ENTRY,
            ADD,
            MODIFY,
            DELETE,
            MODRDN
        };

        LdifReader( std::istream &input );

        /**
         * Reads the next record.
         * @return The type of the record, NONE at the end of the input
         * @throws LDAPSchemaException if the record is not valid LDIF
         */
        int readNextRecord();

        /**
         * @return The type/value pairs of the current record, starting
         *      with the "dn" line. In MODIFY records each "-" line is
         *      kept as a pair with the type "-" and an empty value.
         */
        const LdifRecord& getRecord() const;

        /**
         * @return The type of the current record, as returned by the
         *      last call of readNextRecord()
         */
        int getRecordType() const;

    private:
        int getLdifLine(std::string &line);

        int splitLine(const std::string& line,
                    std::string &type,
                    std::string &value );

        std::istream &m_ldifstream;
        LdifRecord m_currentRecord;
        int m_curRecType;
        int m_lineNo;
};

#endif /* LDIF_READER_H */
