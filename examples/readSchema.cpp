#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>

#include "LDAPSchema.h"
#include "LDAPSchemaBuilder.h"
#include "LDAPSchemaException.h"
#include "LDAPSchemaOptions.h"

#include "debug.h"

using namespace std;

static void usage(const char* prog){
    cerr << "usage: " << prog << " [-s] [-d] schema.ldif" << endl;
    cerr << "    -s  reject the schema if any definition fails" << endl;
    cerr << "    -d  trace the build on stderr" << endl;
}

int main(int argc, char* argv[]){
    LDAPSchemaOptions options;
    const char* file = 0;

    for(int i = 1; i < argc; i++){
        if(strcmp(argv[i], "-s") == 0){
            options.setStrict(true);
        }else if(strcmp(argv[i], "-d") == 0){
            LDAPSchemaOptions::setDebugLevel(LDAPSCHEMA_DEBUG_TRACE);
        }else if(argv[i][0] != '-' && file == 0){
            file = argv[i];
        }else{
            usage(argv[0]);
            return 2;
        }
    }
    if(file == 0){
        usage(argv[0]);
        return 2;
    }

    ifstream input(file);
    if(!input){
        cerr << "could not open " << file << endl;
        return 1;
    }

    try{
        LDAPSchemaBuilder builder(options);
        builder.addCoreSchema();
        int count = builder.addSchemaFromLdif(input);
        cout << "----------------------read " << count
                << " definitions from " << file << endl;

        unique_ptr<LDAPSchema> schema(builder.build());
        LDAPSchema::AttrTypeList types = schema->getAttributeTypes();
        LDAPSchema::AttrTypeList::const_iterator i;
        for(i = types.begin(); i != types.end(); i++){
            cout << (*i)->toString() << endl;
            const LDAPMatchRule* eq = (*i)->getEqualityMatchingRule();
            if(eq != 0){
                cout << "    equality: " << eq->getNameOrOid() << endl;
            }
        }

        const list<LDAPSchemaException>& warnings = schema->getWarnings();
        if(!warnings.empty()){
            cout << "----------------------" << warnings.size()
                    << " warnings" << endl;
        }
        list<LDAPSchemaException>::const_iterator w;
        for(w = warnings.begin(); w != warnings.end(); w++){
            cout << *w << endl;
        }
    }catch(const LDAPSchemaException& e){
        cout << "------------------------- caught Exception ---------"<< endl;
        cout << e << endl;
        return 1;
    }
    return 0;
}
