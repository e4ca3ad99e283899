/*
 * Copyright 2000, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_SCHEMA_OPTIONS_H
#define LDAP_SCHEMA_OPTIONS_H

#include <ldap_schema.h>

//! libldap parser flags used when nothing else is configured
#define LDAPSCHEMA_PARSE_FLAG \
    (LDAP_SCHEMA_ALLOW_NO_OID | LDAP_SCHEMA_ALLOW_QUOTED)

//! Class for representating the options of a schema build
/*! This class represents the options that can be set for a
 *  LDAPSchemaBuilder. Namely these are the flags handed to the libldap
 *  definition parser, the policy for definitions that fail validation
 *  and whether definitions may replace each other.
 */
class LDAPSchemaOptions{

	private :
        //! LDAP_SCHEMA_ALLOW_* flags for the ldap_str2*() parsers
		int m_parseFlags;

        //! Reject the whole build if a single definition fails
		bool m_strict;

        //! Allow a definition to replace one with the same OID
		bool m_allowOverwrite;

	public :
		//! Constructs a LDAPSchemaOptions object with default values
		LDAPSchemaOptions();

		//! Copy constructor
		LDAPSchemaOptions(const LDAPSchemaOptions& o);

        ~LDAPSchemaOptions();

		void setParseFlags(int flags);
		void setStrict(bool strict);
		void setAllowOverwrite(bool overwrite);
		int getParseFlags() const;
		bool isStrict() const;
		bool getAllowOverwrite() const;

        /**
         * Sets the process wide mask of LDAPSCHEMA_DEBUG_* levels that
         * are written to stderr.
         */
        static void setDebugLevel(int level);
        static int getDebugLevel();
};
#endif //LDAP_SCHEMA_OPTIONS_H
