/*
 * Copyright 2010, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAP_SCHEMA_HOLDER_H
#define LDAP_SCHEMA_HOLDER_H

#include <memory>
#include <mutex>

class LDAPSchema;

/**
 * The place where the threads of a server pick up the current schema.
 *
 * A new schema replaces the old one in one step. Readers that got the
 * old schema from getSchema() keep it until they release their pointer.
 */
class LDAPSchemaHolder{
    public :
        /**
         * Constructs a holder without a schema
         */
        LDAPSchemaHolder();

        /**
         * Constructs a holder that takes the ownership of schema
         */
        explicit LDAPSchemaHolder(LDAPSchema* schema);

        virtual ~LDAPSchemaHolder();

        /**
         * @return The current schema, an empty pointer if no schema was
         *      set yet
         */
        std::shared_ptr<const LDAPSchema> getSchema() const;

        /**
         * Replaces the current schema. The holder takes the ownership
         * of schema, which must not be changed anymore.
         */
        void setSchema(LDAPSchema* schema);

    private :
        LDAPSchemaHolder(const LDAPSchemaHolder&);
        LDAPSchemaHolder& operator=(const LDAPSchemaHolder&);

        mutable std::mutex m_mutex;
        std::shared_ptr<const LDAPSchema> m_schema;
};

#endif // LDAP_SCHEMA_HOLDER_H
