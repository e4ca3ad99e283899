/*
 * Copyright 2000, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */


#ifndef LDAP_SCHEMA_EXCEPTION_H
#define LDAP_SCHEMA_EXCEPTION_H

#include <iostream>
#include <string>

/**
 * This class is only thrown as an Exception and used to signalize a
 * schema definition that could not be parsed, resolved or validated.
 * Schema builds also keep a list of these objects as warnings.
 */
class LDAPSchemaException{

	public :
        enum ErrorKind {
            //! required field missing or conflicting fields
            MALFORMED_DEFINITION=0,
            //! referenced OID or name is not registered
            UNRESOLVED_REFERENCE,
            //! usage or collective flag differs from the superior type
            INVALID_SUPERIOR_RELATIONSHIP,
            //! collective/operational or no-user-modification conflict
            INVALID_USAGE_COMBINATION,
            //! superior chain revisits a type that is being resolved
            CYCLIC_REFERENCE,
            //! resolved state was read before resolution
            ILLEGAL_STATE
        };

        /**
         * Constructs a LDAPSchemaException-object from the parameters
         * @param kind The kind of schema error
         * @param definition Name or OID of the offending definition
         * @param err_string A diagnostic message describing the error
         */
		LDAPSchemaException(ErrorKind kind, const std::string& definition,
                const std::string& err_string=std::string());

        /**
         * Destructor
         */
        virtual ~LDAPSchemaException();

        /**
         * @return The kind of schema error
         */
        ErrorKind getKind() const;

        /**
         * @return The LDAP result code that corresponds to the kind
         */
		int getResultCode() const;

        /**
         * @return The error message that is corresponding to the result
         *          code.
         */
		const std::string& getResultMsg() const;

        /**
         * @return The name or OID of the definition that failed
         */
        const std::string& getDefinition() const;

        /**
         * @return The diagnostic message of the error
         */
        const std::string& getErrorMsg() const;

        static const char* kindToString(ErrorKind kind);

        /**
         * This method can be used to dump the data of a
         * LDAPSchemaException-Object to a log.
         */
		friend std::ostream& operator << (std::ostream &s,
                const LDAPSchemaException& e);

	private :
        ErrorKind m_kind;
		int m_res_code;
		std::string m_res_string;
        std::string m_definition;
		std::string m_err_string;
};
#endif //LDAP_SCHEMA_EXCEPTION_H
