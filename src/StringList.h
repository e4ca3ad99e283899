/*
 * Copyright 2000, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef STRING_LIST_H
#define STRING_LIST_H

#include <string>
#include <list>
typedef std::list<std::string> ListType;

/**
 * Ordered list of strings, used for the names of schema definitions and
 * the values of their extension properties
 */
class StringList{
    public:
        typedef ListType::const_iterator const_iterator;

        StringList();
        StringList(const StringList& sl);

        /**
         * Copies a 0-terminated array of C-strings as returned by the
         * libldap schema parser. A 0-pointer creates an empty list.
         */
        StringList(char** values);
        ~StringList();

        /**
         * @return A 0-terminated copy of the list, allocated with
         *      new[]. Release it with StringList::freeCharArray().
         */
        char** toCharArray() const;
        static void freeCharArray(char** values);

        void add(const std::string& value);
        size_t size() const;
        bool empty() const;
        const std::string& front() const;
        const_iterator begin() const;
        const_iterator end() const;
        void clear();

    private:
        ListType m_data;
};
#endif //STRING_LIST_H
