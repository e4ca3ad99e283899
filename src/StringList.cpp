/*
 * Copyright 2000, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#include <cstring>
#include "StringList.h"

using namespace std;

StringList::StringList(){
}

StringList::StringList(const StringList& sl){
    m_data = sl.m_data;
}

StringList::StringList(char** values){
    if(values == 0){
        return;
    }
    for(char** i = values; *i != 0; i++){
        m_data.push_back(string(*i));
    }
}

StringList::~StringList(){
}

char** StringList::toCharArray() const{
    char** ret = new char*[m_data.size()+1];
    const_iterator i;
    int j = 0;
    for(i = m_data.begin(); i != m_data.end(); i++, j++){
        ret[j] = new char[i->size()+1];
        memcpy(ret[j], i->c_str(), i->size()+1);
    }
    ret[m_data.size()] = 0;
    return ret;
}

void StringList::freeCharArray(char** values){
    if(values == 0){
        return;
    }
    for(char** i = values; *i != 0; i++){
        delete[] *i;
    }
    delete[] values;
}

void StringList::add(const string& value){
    m_data.push_back(value);
}

size_t StringList::size() const{
    return m_data.size();
}

bool StringList::empty() const{
    return m_data.empty();
}

const string& StringList::front() const{
    return m_data.front();
}

StringList::const_iterator StringList::begin() const{
    return m_data.begin();
}

StringList::const_iterator StringList::end() const{
    return m_data.end();
}

void StringList::clear(){
    m_data.clear();
}
